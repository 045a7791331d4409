/*
 *  ibc_paradigms.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <iostream>

#include "Args.h"
#include "JSON.h"
#include "Paradigm.h"
#include "Util.h"

int paradigms_main(args::Subparser &parser) {
    args::Positional<std::string> paradigm(
        parser, "PARADIGM", "Print the contrast names of this paradigm instead of listing all");
    args::Flag json_out(parser, "JSON", "Print the declared contrasts as JSON", {'j', "json"});
    parser.Parse();

    if (paradigm) {
        auto const &def = IBC::Definition(IBC::ParseParadigm(paradigm.Get()));
        IBC::Log(verbose,
                 "Paradigm {} ({}) declares {} contrasts over {} regressors",
                 paradigm.Get(),
                 def.id,
                 def.names.size(),
                 def.regressors.size());
        if (json_out) {
            json doc = json::object();
            for (auto const &kv : IBC::Schema(def)) {
                doc[kv.first] = json::array();
            }
            IBC::WriteJSON(std::cout, doc);
        } else {
            for (auto const &name : def.names) {
                std::cout << name << '\n';
            }
        }
    } else {
        for (auto const p : IBC::AllParadigms()) {
            fmt::print("{}\n", fmt::join(IBC::Identifiers(p), " "));
        }
    }
    return EXIT_SUCCESS;
}
