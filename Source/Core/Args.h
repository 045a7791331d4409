/*
 *  Args.h
 *
 *  Copyright (c) 2017 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#pragma once

#include <string>

#include "Log.h"
#include "args.hxx"

namespace IBC {

template <typename T> T CheckPos(args::Positional<T> &a) {
    if (a) {
        return a.Get();
    } else {
        IBC::Fail("{} was not specified. Use --help to see usage.", a.Name());
    }
}

} // End namespace IBC

extern args::Group    global_group;
extern args::HelpFlag help;
extern args::Flag     verbose;
extern args::Flag     version;
