/*
 *  Catalog.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_CATALOG_H
#define IBC_CATALOG_H

#include <iosfwd>
#include <string>
#include <vector>

namespace IBC {

/*
 * One first-level statistical image
 */
struct CatalogEntry {
    std::string subject, contrast, acquisition, task, path;
};

using Catalog = std::vector<CatalogEntry>;

/*
 * Reads a tab-separated catalog with at least the columns subject, contrast, acquisition, task
 * and path. Relative paths are resolved against `base_dir`.
 */
Catalog ReadCatalog(std::istream &is, std::string const &name, std::string const &base_dir);
Catalog ReadCatalog(std::string const &path); //!< Relative paths are resolved against the file

void    CheckFiles(Catalog const &catalog); //!< Throws IOError naming the first missing image
Catalog FilterAcquisitions(Catalog const &catalog, std::vector<std::string> const &acquisitions);
std::vector<std::string> Paths(Catalog const &catalog);

/*
 * Distinct values of a field, in order of first appearance
 */
std::vector<std::string> Unique(Catalog const &catalog, std::string CatalogEntry::*field);

} // End namespace IBC

#endif // IBC_CATALOG_H
