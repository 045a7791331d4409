/*
 *  Stanford.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include "Definitions.h"

namespace IBC {

ParadigmDefinition const &SelectiveStopSignalDefinition() {
    static ParadigmDefinition const def{
        "selective_stop_signal",
        {"go", "stop", "ignore", "stop-go", "ignore-stop", "stop-ignore", "ignore-go"},
        {"go", "stop", "ignore"},
        [](Elementary const &con) -> ContrastMap {
            return {{"go", con["go"]},
                    {"stop", con["stop"]},
                    {"ignore", con["ignore"]},
                    {"stop-go", con["stop"] - con["go"]},
                    {"ignore-stop", con["ignore"] - con["stop"]},
                    {"stop-ignore", con["stop"] - con["ignore"]},
                    {"ignore-go", con["ignore"] - con["go"]}};
        }};
    return def;
}

ParadigmDefinition const &StopSignalDefinition() {
    static ParadigmDefinition const def{
        "stop_signal",
        {"go", "stop", "stop-go"},
        {"go", "stop"},
        [](Elementary const &con) -> ContrastMap {
            return {{"go", con["go"]}, {"stop", con["stop"]}, {"stop-go", con["stop"] - con["go"]}};
        }};
    return def;
}

ParadigmDefinition const &StroopDefinition() {
    static ParadigmDefinition const def{
        "stroop",
        {"congruent", "incongruent", "congruent-incongruent", "incongruent-congruent"},
        {"congruent", "incongruent"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const diff = con["incongruent"] - con["congruent"];
            return {{"congruent", con["congruent"]},
                    {"incongruent", con["incongruent"]},
                    {"incongruent-congruent", diff},
                    {"congruent-incongruent", -diff}};
        }};
    return def;
}

ParadigmDefinition const &DiscountDefinition() {
    static ParadigmDefinition const def{
        "discount", {"delay", "amount"}, {"delay", "amount"}, [](Elementary const &con) -> ContrastMap {
            return {{"delay", con["delay"]}, {"amount", con["amount"]}};
        }};
    return def;
}

ParadigmDefinition const &AttentionDefinition() {
    static ParadigmDefinition const def{
        "attention",
        {"spatial_cue-double_cue", "spatial_cue", "double_cue", "incongruent-congruent",
         "spatial_incongruent-spatial_congruent", "double_incongruent-double_congruent",
         "spatial_incongruent", "double_congruent", "spatial_congruent", "double_incongruent"},
        {"spatialcue", "doublecue", "spatial_incongruent", "spatial_congruent",
         "double_incongruent", "double_congruent"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const spatial =
                con["spatial_incongruent"] - con["spatial_congruent"];
            Eigen::RowVectorXd const dbl = con["double_incongruent"] - con["double_congruent"];
            return {{"spatial_cue-double_cue", con["spatialcue"] - con["doublecue"]},
                    {"spatial_cue", con["spatialcue"]},
                    {"double_cue", con["doublecue"]},
                    {"incongruent-congruent", spatial + dbl},
                    {"spatial_incongruent-spatial_congruent", spatial},
                    {"double_incongruent-double_congruent", dbl},
                    {"spatial_incongruent", con["spatial_incongruent"]},
                    {"double_congruent", con["double_congruent"]},
                    {"spatial_congruent", con["spatial_congruent"]},
                    {"double_incongruent", con["double_incongruent"]}};
        }};
    return def;
}

// Tower of London planning task
ParadigmDefinition const &WardAndAllportDefinition() {
    static ParadigmDefinition const def{
        "ward_and_aliport",
        {"ambiguous_intermediate", "ambiguous_direct", "unambiguous_intermediate",
         "unambiguous_direct", "intermediate-direct", "ambiguous-unambiguous"},
        {"ambiguous_intermediate", "ambiguous_direct", "unambiguous_intermediate",
         "unambiguous_direct"},
        [](Elementary const &con) -> ContrastMap {
            auto const &ai = con["ambiguous_intermediate"];
            auto const &ad = con["ambiguous_direct"];
            auto const &ui = con["unambiguous_intermediate"];
            auto const &ud = con["unambiguous_direct"];
            return {{"ambiguous_intermediate", ai},
                    {"ambiguous_direct", ad},
                    {"unambiguous_intermediate", ui},
                    {"unambiguous_direct", ud},
                    {"intermediate-direct", ai + ui - (ad + ud)},
                    {"ambiguous-unambiguous", ai - ui + ad - ud}};
        }};
    return def;
}

ParadigmDefinition const &TwoByTwoDefinition() {
    static ParadigmDefinition const def{
        "two_by_two",
        {"task_stay_cue_stay", "task_switch_cue_switch", "task_switch_cue_stay",
         "task_stay_cue_switch", "task_switch-stay", "cue_switch"},
        {"taskstay_cuestay", "taskswitch_cueswitch", "taskswitch_cuestay", "taskstay_cueswitch"},
        [](Elementary const &con) -> ContrastMap {
            return {{"task_stay_cue_stay", con["taskstay_cuestay"]},
                    {"task_switch_cue_switch", con["taskswitch_cueswitch"]},
                    {"task_switch_cue_stay", con["taskswitch_cuestay"]},
                    {"task_stay_cue_switch", con["taskstay_cueswitch"]},
                    {"task_switch-stay",
                     con["taskswitch_cueswitch"] + con["taskswitch_cuestay"] -
                         2.0 * con["taskstay_cueswitch"]},
                    {"cue_switch", con["taskstay_cueswitch"] - con["taskstay_cuestay"]}};
        }};
    return def;
}

ParadigmDefinition const &ColumbiaCardsDefinition() {
    static ParadigmDefinition const def{
        "columbia_cards",
        {"num_loss_cards", "loss", "gain"},
        {"num_loss_cards", "loss", "gain"},
        [](Elementary const &con) -> ContrastMap {
            return {{"num_loss_cards", con["num_loss_cards"]},
                    {"loss", con["loss"]},
                    {"gain", con["gain"]}};
        }};
    return def;
}

ParadigmDefinition const &DotPatternsDefinition() {
    static ParadigmDefinition const def{
        "dot_patterns",
        {"cue", "correct_cue_correct_probe", "correct_cue_incorrect_probe",
         "incorrect_cue_correct_probe", "incorrect_cue_incorrect_probe",
         "correct_cue_incorrect_probe-correct_cue_correct_probe",
         "incorrect_cue_incorrect_probe-incorrect_cue_correct_probe",
         "correct_cue_incorrect_probe-incorrect_cue_correct_probe",
         "incorrect_cue_incorrect_probe-correct_cue_incorrect_probe",
         "correct_cue-incorrect_cue", "incorrect_probe-correct_probe"},
        {"cue", "correct_cue_correct_probe", "correct_cue_incorrect_probe",
         "incorrect_cue_correct_probe", "incorrect_cue_incorrect_probe"},
        [](Elementary const &con) -> ContrastMap {
            auto const &cc = con["correct_cue_correct_probe"];
            auto const &ci = con["correct_cue_incorrect_probe"];
            auto const &ic = con["incorrect_cue_correct_probe"];
            auto const &ii = con["incorrect_cue_incorrect_probe"];
            return {{"cue", con["cue"]},
                    {"correct_cue_correct_probe", cc},
                    {"correct_cue_incorrect_probe", ci},
                    {"incorrect_cue_correct_probe", ic},
                    {"incorrect_cue_incorrect_probe", ii},
                    {"correct_cue_incorrect_probe-correct_cue_correct_probe", ci - cc},
                    {"incorrect_cue_incorrect_probe-incorrect_cue_correct_probe", ii - ic},
                    {"correct_cue_incorrect_probe-incorrect_cue_correct_probe", ci - ic},
                    {"incorrect_cue_incorrect_probe-correct_cue_incorrect_probe", ii - ci},
                    {"correct_cue-incorrect_cue", cc + ci - ic - ii},
                    {"incorrect_probe-correct_probe", -cc + ci - ic + ii}};
        }};
    return def;
}

} // End namespace IBC
