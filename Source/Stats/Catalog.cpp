/*
 *  Catalog.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "Catalog.h"
#include "Exceptions.h"
#include "Table.h"
#include "Util.h"

namespace IBC {

Catalog ReadCatalog(std::istream &is, std::string const &name, std::string const &base_dir) {
    Table const  table    = ReadTable(is, name);
    size_t const subject  = table.column("subject");
    size_t const contrast = table.column("contrast");
    size_t const acq      = table.column("acquisition");
    size_t const task     = table.column("task");
    size_t const path     = table.column("path");

    Catalog catalog;
    for (auto const &row : table.rows) {
        CatalogEntry e{row[subject], row[contrast], row[acq], row[task], row[path]};
        if (e.path.empty()) {
            IBC_THROW(IOError, "Empty path for subject {} contrast {} in {}", e.subject, e.contrast, name);
        }
        if (e.path.front() != '/') {
            e.path = base_dir + "/" + e.path;
        }
        catalog.push_back(e);
    }
    return catalog;
}

Catalog ReadCatalog(std::string const &path) {
    std::ifstream is(path);
    if (!is) {
        IBC_THROW(IOError, "Failed to open catalog: {}", path);
    }
    return ReadCatalog(is, path, Dirname(path));
}

void CheckFiles(Catalog const &catalog) {
    for (auto const &e : catalog) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(e.path, ec)) {
            IBC_THROW(IOError,
                      "Image for subject {} contrast {} acquisition {} is not a file: {}",
                      e.subject,
                      e.contrast,
                      e.acquisition,
                      e.path);
        }
        std::ifstream f(e.path);
        if (!f) {
            IBC_THROW(IOError,
                      "Image for subject {} contrast {} acquisition {} is not readable: {}",
                      e.subject,
                      e.contrast,
                      e.acquisition,
                      e.path);
        }
    }
}

Catalog FilterAcquisitions(Catalog const &catalog, std::vector<std::string> const &acquisitions) {
    Catalog filtered;
    std::copy_if(catalog.begin(),
                 catalog.end(),
                 std::back_inserter(filtered),
                 [&](CatalogEntry const &e) {
                     return std::find(acquisitions.begin(), acquisitions.end(), e.acquisition) !=
                            acquisitions.end();
                 });
    return filtered;
}

std::vector<std::string> Paths(Catalog const &catalog) {
    std::vector<std::string> paths;
    for (auto const &e : catalog) {
        paths.push_back(e.path);
    }
    return paths;
}

std::vector<std::string> Unique(Catalog const &catalog, std::string CatalogEntry::*field) {
    std::vector<std::string> values;
    for (auto const &e : catalog) {
        if (std::find(values.begin(), values.end(), e.*field) == values.end()) {
            values.push_back(e.*field);
        }
    }
    return values;
}

} // End namespace IBC
