/*
 *  Util.cpp
 *  Part of the IBC analysis tools
 *
 *  Copyright (c) 2015 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <sstream>
#include <thread>

#include "Util.h"

#ifndef IBC_VERSION
#define IBC_VERSION "unknown"
#endif

namespace IBC {

int GetDefaultThreads() {
    static char const *env_threads = getenv("IBC_THREADS");
    if (env_threads) {
        int const n = std::atoi(env_threads);
        if (n > 0) {
            return n;
        }
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

const std::string &GetVersion() {
    static const std::string Version{IBC_VERSION};
    return Version;
}

const std::string &OutExt() {
    static char const *env_ext = getenv("IBC_EXT");
    static std::string ext;
    static bool        checked = false;
    if (!checked) {
        static std::map<std::string, std::string> valid_ext{
            {"NIFTI", ".nii"},
            {"NIFTI_PAIR", ".img"},
            {"NIFTI_GZ", ".nii.gz"},
            {"NIFTI_PAIR_GZ", ".img.gz"},
        };
        if (!env_ext || (valid_ext.find(env_ext) == valid_ext.end())) {
            ext = valid_ext["NIFTI_GZ"];
        } else {
            ext = valid_ext[env_ext];
        }
        checked = true;
    }
    return ext;
}

std::string Dirname(const std::string &path) {
    std::size_t slash = path.find_last_of("/");
    if (slash == std::string::npos) {
        return ".";
    } else if (slash == 0) {
        return "/";
    } else {
        return path.substr(0, slash);
    }
}

std::string Lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::string> Split(const std::string &line, const char delim) {
    std::vector<std::string> fields;
    std::string const        trimmed = line.substr(0, line.find_last_not_of('\r') + 1);
    std::istringstream       stream(trimmed);
    std::string              field;
    while (std::getline(stream, field, delim)) {
        field.erase(std::remove(field.begin(), field.end(), '\r'),
                    field.end()); // Deal with rogue ^M characters
        fields.push_back(field);
    }
    // getline does not report the empty field after a trailing delimiter
    if (!trimmed.empty() && trimmed.back() == delim) {
        fields.push_back("");
    }
    return fields;
}

} // namespace IBC
