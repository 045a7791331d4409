/*
 *  Args.cpp
 *  Part of the IBC analysis tools
 *
 *  Copyright (c) 2019 Tobias Wood.
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include "Args.h"

// Shared by ibc and every sub-command
args::Group    global_group("GLOBAL OPTIONS");
args::HelpFlag help(global_group,
                    "HELP",
                    "Show help for ibc or the given sub-command",
                    {'h', "help"});
args::Flag     verbose(global_group,
                       "VERBOSE",
                       "Report progress with time stamps on stderr",
                       {'v', "verbose"});
args::Flag     version(global_group, "VERSION", "Print the ibc version and exit", {"version"});
