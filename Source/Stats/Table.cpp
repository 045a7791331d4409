/*
 *  Table.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <fstream>

#include "Exceptions.h"
#include "Table.h"
#include "Util.h"

namespace IBC {

size_t Table::column(std::string const &name) const {
    auto const it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        IBC_THROW(IOError, "Table does not contain a column named {}", name);
    }
    return std::distance(header.begin(), it);
}

bool Table::has(std::string const &name) const {
    return std::find(header.begin(), header.end(), name) != header.end();
}

Table ReadTable(std::istream &is, std::string const &name) {
    Table       t;
    std::string line;
    // Ignore comment lines. Use shell script convention
    while (is.peek() == '#') {
        std::getline(is, line);
    }
    if (!std::getline(is, line)) {
        IBC_THROW(IOError, "Table {} is empty", name);
    }
    t.header = Split(line, '\t');
    size_t line_number = 1;
    while (std::getline(is, line)) {
        line_number++;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto cells = Split(line, '\t');
        if (cells.size() != t.header.size()) {
            IBC_THROW(IOError,
                      "Line {} of {} has {} cells, header has {}",
                      line_number,
                      name,
                      cells.size(),
                      t.header.size());
        }
        t.rows.push_back(std::move(cells));
    }
    return t;
}

Table ReadTable(std::string const &path) {
    std::ifstream is(path);
    if (!is) {
        IBC_THROW(IOError, "Failed to open table: {}", path);
    }
    return ReadTable(is, path);
}

void WriteTable(std::string const &             path,
                Eigen::MatrixXd const &         m,
                std::vector<std::string> const &row_labels,
                std::vector<std::string> const &col_labels) {
    bool const labelled = !row_labels.empty();
    if ((labelled && static_cast<Eigen::Index>(row_labels.size()) != m.rows()) ||
        static_cast<Eigen::Index>(col_labels.size()) != m.cols()) {
        IBC_THROW(DesignError,
                  "Labels ({} rows, {} columns) do not match {}x{} matrix for {}",
                  row_labels.size(),
                  col_labels.size(),
                  m.rows(),
                  m.cols(),
                  path);
    }
    std::ofstream os(path);
    if (!os) {
        IBC_THROW(IOError, "Could not open file for writing: {}", path);
    }
    if (labelled) {
        os << "\t";
    }
    os << fmt::format("{}\n", fmt::join(col_labels, "\t"));
    for (Eigen::Index r = 0; r < m.rows(); r++) {
        if (labelled) {
            os << row_labels[r] << "\t";
        }
        for (Eigen::Index c = 0; c < m.cols(); c++) {
            if (c) {
                os << "\t";
            }
            os << fmt::format("{}", m(r, c));
        }
        os << "\n";
    }
}

} // End namespace IBC
