/*
 *  JSON.h
 *  Part of the IBC analysis tools
 *
 *  Copyright (c) 2016 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_JSON_H
#define IBC_JSON_H

#include "nlohmann/json.hpp"
#include <Eigen/Core>
#include <iosfwd>
#include <string>

using nlohmann::json;

namespace IBC {

json          ReadJSON(std::istream &is);
json          ReadJSON(std::string const &path);
std::ostream &WriteJSON(std::ostream &os, json const &doc);
void          WriteJSON(std::string const &path, json const &doc);

json MatrixToJSON(Eigen::MatrixXd const &m); //!< Single rows become flat arrays

template <typename T> void GetJSON(json const &j, std::string const &key, T &val);
template <typename T> T GetJSONOr(json const &j, std::string const &key, T const &def) {
    if (j.contains(key)) {
        T val;
        GetJSON(j, key, val);
        return val;
    } else {
        return def;
    }
}

} // End namespace IBC

#endif // IBC_JSON_H
