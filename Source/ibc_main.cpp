#include "Args.h"
#include "Util.h"
#include "commands.h"
#include <iostream>

int main(int argc, char **argv) {
    args::ArgumentParser parser("ibc: contrast definitions and group statistics for the IBC dataset",
                                "Set $IBC_THREADS to limit worker threads and $IBC_EXT (NIFTI, "
                                "NIFTI_PAIR, NIFTI_GZ or NIFTI_PAIR_GZ) to choose the output "
                                "image format");
    args::GlobalOptions  globals(parser, global_group);

#define ADD(CMD, GROUP, HELP) args::Command CMD(GROUP, #CMD, HELP, &CMD##_main);

    args::Group core(parser, "CONTRASTS");
    ADD(paradigms, core, "List paradigm identifiers or the contrasts of one paradigm");
    ADD(contrasts, core, "Build the contrasts of a paradigm for a design matrix");
    args::Group stats(parser, "STATS");
    ADD(group_stats, stats, "ANOVA and similarity analysis of first-level maps");
#undef ADD

    try {
        parser.ParseCLI(argc, argv);
    } catch (args::Help &) {
        std::cerr << parser << '\n';
        exit(EXIT_SUCCESS);
    } catch (args::Error &e) {
        if (version) {
            std::cout << "ibc " << IBC::GetVersion() << '\n';
            exit(EXIT_SUCCESS);
        }
        std::cerr << parser << '\n' << e.what() << '\n';
        exit(EXIT_FAILURE);
    } catch (std::exception &e) {
        IBC::Fail("{}", e.what());
    }

    exit(EXIT_SUCCESS);
}
