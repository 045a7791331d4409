/*
 *  Table.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_TABLE_H
#define IBC_TABLE_H

#include <iosfwd>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace IBC {

/*
 * A tab-separated table with a header line. Every row has exactly as many cells as the header.
 */
struct Table {
    std::vector<std::string>              header;
    std::vector<std::vector<std::string>> rows;

    size_t column(std::string const &name) const; //!< Throws IOError if the column is absent
    bool   has(std::string const &name) const;
};

Table ReadTable(std::istream &is, std::string const &name);
Table ReadTable(std::string const &path);

/*
 * Write a labelled matrix. With no row labels the first column is omitted.
 */
void WriteTable(std::string const &             path,
                Eigen::MatrixXd const &         m,
                std::vector<std::string> const &row_labels,
                std::vector<std::string> const &col_labels);

} // End namespace IBC

#endif // IBC_TABLE_H
