/*
 *  Lyon.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include "Definitions.h"

namespace IBC {

ParadigmDefinition const &LyonMotoDefinition() {
    static ParadigmDefinition const def{
        "lyon_moto",
        {"instructions", "finger_right-fixation", "finger_left-fixation", "foot_left-fixation",
         "foot_right-fixation", "hand_left-fixation", "hand_right-fixation", "saccade-fixation",
         "tongue-fixation"},
        {"instructions", "foot_left", "foot_right", "finger_right", "finger_left", "saccade_left",
         "saccade_right", "hand_left", "hand_right", "fixation_right", "tongue_right",
         "fixation_left", "tongue_left"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const fixation =
                0.5 * (con["fixation_left"] + con["fixation_right"]);
            return {{"instructions", con["instructions"]},
                    {"finger_right-fixation", con["finger_right"] - fixation},
                    {"finger_left-fixation", con["finger_left"] - fixation},
                    {"foot_left-fixation", con["foot_left"] - fixation},
                    {"foot_right-fixation", con["foot_right"] - fixation},
                    {"hand_left-fixation", con["hand_left"] - fixation},
                    {"hand_right-fixation", con["hand_right"] - fixation},
                    {"saccade-fixation",
                     con["saccade_left"] + con["saccade_right"] - 2.0 * fixation},
                    {"tongue-fixation",
                     con["tongue_left"] + con["tongue_right"] - 2.0 * fixation}};
        }};
    return def;
}

ParadigmDefinition const &LyonMcseDefinition() {
    static ParadigmDefinition const def{
        "lyon_mcse",
        {"high_salience_left", "high_salience_right", "low_salience_left", "low_salience_right",
         "high-low_salience", "low-high_salience", "salience_left-right", "salience_right-left",
         "low+high_salience"},
        {"hi_salience_left", "hi_salience_right", "low_salience_left", "low_salience_right"},
        [](Elementary const &con) -> ContrastMap {
            auto const &             hl   = con["hi_salience_left"];
            auto const &             hr   = con["hi_salience_right"];
            auto const &             ll   = con["low_salience_left"];
            auto const &             lr   = con["low_salience_right"];
            Eigen::RowVectorXd const hi_lo = hl + hr - ll - lr;
            Eigen::RowVectorXd const l_r   = hl - hr + ll - lr;
            return {{"high_salience_left", hl},
                    {"high_salience_right", hr},
                    {"low_salience_left", ll},
                    {"low_salience_right", lr},
                    {"high-low_salience", hi_lo},
                    {"low-high_salience", -hi_lo},
                    {"salience_left-right", l_r},
                    {"salience_right-left", -l_r},
                    {"low+high_salience", hl + hr + ll + lr}};
        }};
    return def;
}

ParadigmDefinition const &LyonMvebDefinition() {
    static ParadigmDefinition const def{
        "lyon_mveb",
        {"response", "2_letters_different", "2_letters_same", "4_letters_different",
         "4_letters_same", "6_letters_different", "6_letters_same", "2_letters_different-same",
         "4_letters_different-same", "6_letters_different-same",
         "6_letters_different-2_letters_different"},
        {"response", "2_letters_different", "2_letters_same", "4_letters_different",
         "4_letters_same", "6_letters_different", "6_letters_same"},
        [](Elementary const &con) -> ContrastMap {
            ContrastMap c;
            for (auto const &n : {"response", "2_letters_different", "2_letters_same",
                                  "4_letters_different", "4_letters_same",
                                  "6_letters_different", "6_letters_same"}) {
                c[n] = con[n];
            }
            for (auto const &k : {"2", "4", "6"}) {
                std::string const p{k};
                c[p + "_letters_different-same"] =
                    con[p + "_letters_different"] - con[p + "_letters_same"];
            }
            c["6_letters_different-2_letters_different"] =
                con["6_letters_different"] - con["2_letters_different"];
            return c;
        }};
    return def;
}

ParadigmDefinition const &LyonMvisDefinition() {
    static ParadigmDefinition const def{
        "lyon_mvis",
        {"response", "2_dots-2_dots_control", "4_dots-4_dots_control", "6_dots-6_dots_control",
         "6_dots-2_dots", "dots-control"},
        {"response", "2_dots", "2_dots_control", "4_dots", "4_dots_control", "6_dots",
         "6_dots_control"},
        [](Elementary const &con) -> ContrastMap {
            return {{"response", con["response"]},
                    {"2_dots-2_dots_control", con["2_dots"] - con["2_dots_control"]},
                    {"4_dots-4_dots_control", con["4_dots"] - con["4_dots_control"]},
                    {"6_dots-6_dots_control", con["6_dots"] - con["6_dots_control"]},
                    {"6_dots-2_dots", con["6_dots"] - con["2_dots"]},
                    {"dots-control",
                     con["6_dots"] + con["4_dots"] + con["2_dots"] -
                         (con["2_dots_control"] + con["6_dots_control"] +
                          con["4_dots_control"])}};
        }};
    return def;
}

ParadigmDefinition const &LyonLec1Definition() {
    static ParadigmDefinition const def{
        "lyon_lec1",
        {"pseudoword", "word", "random_string", "word-pseudoword", "word-random_string",
         "pseudoword-random_string"},
        {"pseudoword", "word", "random_string"},
        [](Elementary const &con) -> ContrastMap {
            return {{"pseudoword", con["pseudoword"]},
                    {"word", con["word"]},
                    {"random_string", con["random_string"]},
                    {"word-pseudoword", con["word"] - con["pseudoword"]},
                    {"word-random_string", con["word"] - con["random_string"]},
                    {"pseudoword-random_string", con["pseudoword"] - con["random_string"]}};
        }};
    return def;
}

ParadigmDefinition const &LyonLec2Definition() {
    static ParadigmDefinition const def{
        "lyon_lec2",
        {"attend", "unattend", "attend-unattend"},
        {"attend", "unattend"},
        [](Elementary const &con) -> ContrastMap {
            return {{"attend", con["attend"]},
                    {"unattend", con["unattend"]},
                    {"attend-unattend", con["attend"] - con["unattend"]}};
        }};
    return def;
}

namespace {
// Every sound category except silence, which is the reference
const std::vector<std::string> AudiSounds{"tear",  "suomi",    "yawn",        "human",
                                          "music", "reverse",  "speech",      "alphabet",
                                          "cough", "environment", "laugh",    "animals"};

const std::vector<std::string> VisuCategories{"scrambled", "scene",      "tool",
                                              "face",      "house",      "animal",
                                              "characters", "pseudoword"};

std::vector<std::string> AudiNames() {
    std::vector<std::string> names = AudiSounds;
    names.push_back("silence");
    for (auto const &s : AudiSounds) {
        names.push_back(s + "-silence");
    }
    return names;
}

std::vector<std::string> VisuNames() {
    std::vector<std::string> names = VisuCategories;
    names.push_back("target_fruit");
    for (auto const &c : VisuCategories) {
        if (c != "scrambled") {
            names.push_back(c + "-scrambled");
        }
    }
    return names;
}
} // namespace

ParadigmDefinition const &LyonAudiDefinition() {
    static ParadigmDefinition const def{
        "lyon_audi", AudiNames(), [] {
            std::vector<std::string> r = AudiSounds;
            r.push_back("silence");
            return r;
        }(),
        [](Elementary const &con) -> ContrastMap {
            ContrastMap c{{"silence", con["silence"]}};
            for (auto const &s : AudiSounds) {
                c[s]              = con[s];
                c[s + "-silence"] = con[s] - con["silence"];
            }
            return c;
        }};
    return def;
}

ParadigmDefinition const &LyonVisuDefinition() {
    static ParadigmDefinition const def{
        "lyon_visu", VisuNames(), [] {
            std::vector<std::string> r = VisuCategories;
            r.push_back("target_fruit");
            return r;
        }(),
        [](Elementary const &con) -> ContrastMap {
            ContrastMap c{{"target_fruit", con["target_fruit"]}};
            for (auto const &v : VisuCategories) {
                c[v] = con[v];
                if (v != "scrambled") {
                    c[v + "-scrambled"] = con[v] - con["scrambled"];
                }
            }
            return c;
        }};
    return def;
}

} // End namespace IBC
