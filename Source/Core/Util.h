/*
 *  Util.h
 *  Part of the IBC analysis tools
 *
 *  Copyright (c) 2015 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_UTIL_H
#define IBC_UTIL_H

#include <string>
#include <vector>

#include "Log.h"

namespace IBC {

int GetDefaultThreads(); //!< Return the number of threads in the $IBC_THREADS environment variable
const std::string &GetVersion(); //!< Return the version of the IBC library
const std::string &OutExt();     //!< Return the extension stored in $IBC_EXT

std::string Dirname(const std::string &path);      //!< Return the directory part, or "."
std::string Lowercase(std::string s);
std::vector<std::string> Split(const std::string &line, const char delim);

} // namespace IBC

#endif // IBC_UTIL_H
