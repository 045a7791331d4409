#pragma once

int paradigms_main(args::Subparser &parser);
int contrasts_main(args::Subparser &parser);
int group_stats_main(args::Subparser &parser);
