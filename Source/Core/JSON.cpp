/*
 *  JSON.cpp
 *  Part of the IBC analysis tools
 *
 *  Copyright (c) 2016 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <fstream>
#include <istream>
#include <vector>

#include "Exceptions.h"
#include "JSON.h"

namespace IBC {

json ReadJSON(std::istream &is) {
    try {
        return json::parse(is);
    } catch (json::parse_error &e) {
        IBC_THROW(IOError, "Failed to parse JSON: {}", e.what());
    }
}

json ReadJSON(std::string const &path) {
    std::ifstream ifs(path);
    if (ifs) {
        return ReadJSON(ifs);
    } else {
        IBC_THROW(IOError, "Error opening file for reading: {}", path);
    }
}

std::ostream &WriteJSON(std::ostream &os, json const &doc) {
    os << doc.dump(2) << std::endl;
    return os;
}

void WriteJSON(std::string const &path, json const &doc) {
    std::ofstream ofs(path);
    if (ofs) {
        WriteJSON(ofs, doc);
    } else {
        IBC_THROW(IOError, "Could not open file for writing: {}", path);
    }
}

json MatrixToJSON(Eigen::MatrixXd const &m) {
    if (m.rows() == 1) {
        return std::vector<double>(m.data(), m.data() + m.size());
    }
    json rows = json::array();
    for (Eigen::Index r = 0; r < m.rows(); r++) {
        std::vector<double> row(m.cols());
        for (Eigen::Index c = 0; c < m.cols(); c++) {
            row[c] = m(r, c);
        }
        rows.push_back(row);
    }
    return rows;
}

template <typename T> void GetJSON(json const &j, std::string const &key, T &val) {
    try {
        j.at(key).get_to(val);
    } catch (json::exception &e) {
        IBC_THROW(IOError, "Error reading from JSON value {}: {}", key, e.what());
    }
}

template void GetJSON<bool>(json const &j, std::string const &key, bool &val);
template void GetJSON<double>(json const &j, std::string const &key, double &val);
template void GetJSON<int>(json const &j, std::string const &key, int &val);
template void GetJSON<std::string>(json const &j, std::string const &key, std::string &val);
template void GetJSON<std::vector<std::string>>(json const &       j,
                                                std::string const &key,
                                                std::vector<std::string> &val);

} // End namespace IBC
