/*
 *  ibc_contrasts.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <fstream>
#include <iostream>

#include "Args.h"
#include "Exceptions.h"
#include "JSON.h"
#include "Paradigm.h"
#include "Util.h"

namespace {
/*
 * Column labels, either one per line or tab-separated on one or more lines
 */
IBC::Columns ReadColumns(std::istream &is) {
    IBC::Columns columns;
    std::string  line;
    while (std::getline(is, line)) {
        for (auto const &label : IBC::Split(line, '\t')) {
            if (!label.empty()) {
                columns.push_back(label);
            }
        }
    }
    return columns;
}
} // namespace

int contrasts_main(args::Subparser &parser) {
    args::Positional<std::string> paradigm(parser, "PARADIGM", "Paradigm identifier");
    args::Positional<std::string> columns_path(
        parser, "COLUMNS", "File with the design matrix column labels, - for stdin");
    args::ValueFlag<std::string> out_path(
        parser, "OUTPUT", "Write the contrasts to this JSON file instead of stdout", {'o', "out"});
    parser.Parse();

    auto const   id   = IBC::CheckPos(paradigm);
    auto const   path = IBC::CheckPos(columns_path);
    IBC::Columns columns;
    if (path == "-") {
        columns = ReadColumns(std::cin);
    } else {
        std::ifstream is(path);
        if (!is) {
            IBC_THROW(IBC::IOError, "Failed to open column labels: {}", path);
        }
        columns = ReadColumns(is);
    }
    IBC::Log(verbose, "Read {} column labels from {}", columns.size(), path);

    auto const contrasts = IBC::MakeContrasts(id, columns);
    json       doc       = json::object();
    for (auto const &kv : contrasts) {
        doc[kv.first] = IBC::MatrixToJSON(kv.second);
    }
    IBC::Log(verbose, "Paradigm {} produced {} contrasts", id, contrasts.size());
    if (out_path) {
        IBC::WriteJSON(out_path.Get(), doc);
    } else {
        IBC::WriteJSON(std::cout, doc);
    }
    return EXIT_SUCCESS;
}
