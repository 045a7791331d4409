/*
 *  Localizers.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <map>

#include "Definitions.h"
#include "Exceptions.h"

namespace IBC {

namespace {
// Definitions whose contrasts are exactly their regressors
ParadigmDefinition Passthrough(std::string const &id, std::vector<std::string> const &labels) {
    return ParadigmDefinition{id, labels, labels, [labels](Elementary const &con) -> ContrastMap {
                                  ContrastMap c;
                                  for (auto const &l : labels) {
                                      c[l] = con[l];
                                  }
                                  return c;
                              }};
}

std::vector<std::string> Levels(std::string const &prefix, int const n) {
    std::vector<std::string> l;
    for (int i = 1; i <= n; i++) {
        l.push_back(prefix + std::to_string(i));
    }
    return l;
}

ParadigmDefinition NumerosityDefinition(std::string const &id,
                                        std::string const &prefix,
                                        int const          n) {
    auto const levels = Levels("response_num_", n);
    return ParadigmDefinition{
        id,
        {prefix + "_linear", prefix + "_constant", prefix + "_quadratic"},
        levels,
        [prefix, levels](Elementary const &con) -> ContrastMap {
            ContrastMap c;
            AddPolynomialContrasts(prefix, levels, con, c);
            return c;
        }};
}

/*
 * The west-east and south-north MTT designs are mirror images. `first` and `second` are
 * the two sides of the spatial axis, in the order the difference contrast is named.
 */
ParadigmDefinition MttAxisDefinition(std::string const &axis,
                                     std::string const &first,
                                     std::string const &second) {
    std::string const a  = axis + "_";
    std::string const fs = first + "-" + second + "_event";
    std::string const sf = second + "-" + first + "_event";
    return ParadigmDefinition{
        axis == "we" ? "MTTWE" : "MTTNS",
        {a + "average_reference", a + "all_space_cue", a + "all_time_cue",
         a + "all_space-time_cue", a + "all_time-space_cue", a + "average_event",
         a + "space_event", a + "time_event", a + "space-time_event", a + "time-space_event",
         fs, sf, a + "before-after_event", a + "after-before_event",
         a + "all_event_response"},
        {a + "all_reference", a + "all_space_cue", a + "all_time_cue",
         a + first + "_close_event", a + first + "_far_event", a + second + "_close_event",
         a + second + "_far_event", a + "before_close_event", a + "before_far_event",
         a + "after_close_event", a + "after_far_event", a + "all_event_response"},
        [a, first, second, fs, sf](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const side1 =
                con[a + first + "_close_event"] + con[a + first + "_far_event"];
            Eigen::RowVectorXd const side2 =
                con[a + second + "_close_event"] + con[a + second + "_far_event"];
            Eigen::RowVectorXd const before =
                con[a + "before_close_event"] + con[a + "before_far_event"];
            Eigen::RowVectorXd const after =
                con[a + "after_close_event"] + con[a + "after_far_event"];
            Eigen::RowVectorXd const space      = side1 + side2;
            Eigen::RowVectorXd const time       = before + after;
            Eigen::RowVectorXd const space_time = space - time;
            Eigen::RowVectorXd const cue =
                con[a + "all_space_cue"] - con[a + "all_time_cue"];
            return {{a + "average_reference", con[a + "all_reference"]},
                    {a + "all_space_cue", con[a + "all_space_cue"]},
                    {a + "all_time_cue", con[a + "all_time_cue"]},
                    {a + "all_space-time_cue", cue},
                    {a + "all_time-space_cue", -cue},
                    {a + "average_event", space + time},
                    {a + "space_event", space},
                    {a + "time_event", time},
                    {a + "space-time_event", space_time},
                    {a + "time-space_event", -space_time},
                    {fs, side1 - side2},
                    {sf, side2 - side1},
                    {a + "before-after_event", before - after},
                    {a + "after-before_event", after - before},
                    {a + "all_event_response", con[a + "all_event_response"]}};
        }};
}
} // namespace

ParadigmDefinition const &WedgeDefinition() {
    static ParadigmDefinition const def =
        Passthrough("wedge",
                    {"lower_meridian", "lower_right", "right_meridian", "upper_right",
                     "upper_meridian", "upper_left", "left_meridian", "lower_left"});
    return def;
}

ParadigmDefinition const &RingDefinition() {
    static ParadigmDefinition const def = Passthrough("ring", {"foveal", "middle", "peripheral"});
    return def;
}

ParadigmDefinition const &PreferenceDefinition(std::string const &domain) {
    static std::map<std::string, ParadigmDefinition> const defs = [] {
        std::map<std::string, ParadigmDefinition> d;
        for (std::string const dom : {"painting", "house", "face", "food"}) {
            d.emplace(dom,
                      Passthrough("preference_" + dom,
                                  {dom + "_linear", dom + "_constant", dom + "_quadratic"}));
        }
        return d;
    }();
    auto const it = defs.find(domain);
    if (it == defs.end()) {
        throw UnknownParadigm("preference_" + domain);
    }
    return it->second;
}

ParadigmDefinition const &MttDefinition(std::string const &axis) {
    static ParadigmDefinition const we = MttAxisDefinition("we", "westside", "eastside");
    static ParadigmDefinition const sn = MttAxisDefinition("sn", "southside", "northside");
    if (axis == "we") {
        return we;
    } else if (axis == "sn") {
        return sn;
    } else {
        throw UnknownParadigm("MTT" + axis);
    }
}

ParadigmDefinition const &VstmDefinition() {
    static ParadigmDefinition const def = NumerosityDefinition("VSTM", "vstm", 6);
    return def;
}

ParadigmDefinition const &EnumerationDefinition() {
    static ParadigmDefinition const def = NumerosityDefinition("enumeration", "enumeration", 8);
    return def;
}

ParadigmDefinition const &RsvpLanguageDefinition() {
    static ParadigmDefinition const def{
        "language",
        {"complex", "simple", "jabberwocky", "word_list", "pseudoword_list", "consonant_string",
         "complex-simple", "sentence-jabberwocky", "sentence-word", "word-consonant_string",
         "jabberwocky-pseudo", "word-pseudo", "pseudo-consonant_string",
         "sentence-consonant_string", "simple-consonant_string", "complex-consonant_string",
         "sentence-pseudo", "probe", "jabberwocky-consonant_string"},
        {"complex_sentence", "simple_sentence", "jabberwocky", "word_list", "pseudoword_list",
         "consonant_strings", "probe"},
        [](Elementary const &con) -> ContrastMap {
            auto const &             complex   = con["complex_sentence"];
            auto const &             simple    = con["simple_sentence"];
            auto const &             jabber    = con["jabberwocky"];
            auto const &             words     = con["word_list"];
            auto const &             pseudo    = con["pseudoword_list"];
            auto const &             consonant = con["consonant_strings"];
            Eigen::RowVectorXd const sentence  = complex + simple;
            return {{"complex", complex},
                    {"simple", simple},
                    {"probe", con["probe"]},
                    {"jabberwocky", jabber},
                    {"word_list", words},
                    {"pseudoword_list", pseudo},
                    {"consonant_string", consonant},
                    {"complex-simple", complex - simple},
                    {"sentence-jabberwocky", sentence - 2.0 * jabber},
                    {"sentence-word", sentence - 2.0 * words},
                    {"word-consonant_string", words - consonant},
                    {"jabberwocky-pseudo", jabber - pseudo},
                    {"jabberwocky-consonant_string", jabber - consonant},
                    {"word-pseudo", words - pseudo},
                    {"pseudo-consonant_string", pseudo - consonant},
                    {"sentence-consonant_string", sentence - 2.0 * consonant},
                    {"simple-consonant_string", simple - consonant},
                    {"complex-consonant_string", complex - consonant},
                    {"sentence-pseudo", sentence - 2.0 * pseudo}};
        }};
    return def;
}

ParadigmDefinition const &ColourDefinition() {
    static ParadigmDefinition const def{
        "colour",
        {"color", "grey", "color-grey"},
        {"color", "grey"},
        [](Elementary const &con) -> ContrastMap {
            return {{"color", con["color"]},
                    {"grey", con["grey"]},
                    {"color-grey", con["color"] - con["grey"]}};
        }};
    return def;
}

ParadigmDefinition const &EmotionalPainDefinition() {
    static ParadigmDefinition const def{
        "emotional_pain",
        {"physical_pain", "emotional_pain", "emotional-physical_pain"},
        {"physical_pain", "emotional_pain"},
        [](Elementary const &con) -> ContrastMap {
            return {{"emotional_pain", con["emotional_pain"]},
                    {"physical_pain", con["physical_pain"]},
                    {"emotional-physical_pain", con["emotional_pain"] - con["physical_pain"]}};
        }};
    return def;
}

ParadigmDefinition const &PainMovieDefinition() {
    static ParadigmDefinition const def{
        "pain_movie",
        {"movie_pain", "movie_mental", "movie_mental-pain"},
        {"pain", "mental"},
        [](Elementary const &con) -> ContrastMap {
            return {{"movie_pain", con["pain"]},
                    {"movie_mental", con["mental"]},
                    {"movie_mental-pain", con["mental"] - con["pain"]}};
        }};
    return def;
}

ParadigmDefinition const &TheoryOfMindDefinition() {
    static ParadigmDefinition const def{
        "theory_of_mind",
        {"belief", "photo", "belief-photo"},
        {"belief", "photo"},
        [](Elementary const &con) -> ContrastMap {
            return {{"photo", con["photo"]},
                    {"belief", con["belief"]},
                    {"belief-photo", con["belief"] - con["photo"]}};
        }};
    return def;
}

// Training clips only serve to fit the encoding models, there is nothing to contrast
ParadigmDefinition const &ClipsTrainingDefinition() {
    static ParadigmDefinition const def{
        "clips_trn", {}, {}, [](Elementary const &) -> ContrastMap { return {}; }, false, false};
    return def;
}

/*
 * Subjects do not always produce every response type in the recognition phase, so several
 * terms fall back to whichever response regressors the run does contain.
 */
ParadigmDefinition const &SelfLocalizerDefinition() {
    static ParadigmDefinition const def{
        "self",
        {"encode_self-other", "encode_other", "encode_self", "instructions", "false_alarm",
         "correct_rejection", "recognition_hit", "recognition_hit-correct_rejection",
         "recognition_self-other", "recognition_self_hit", "recognition_other_hit"},
        {"encode_self", "encode_other", "instructions", "false_alarm", "correct_rejection",
         "recognition_self_hit", "recognition_self_miss", "recognition_other_hit",
         "recognition_other_miss"},
        [](Elementary const &con) -> ContrastMap {
            std::string const self_hit   = "recognition_self_hit";
            std::string const self_miss  = "recognition_self_miss";
            std::string const other_hit  = "recognition_other_hit";
            std::string const other_miss = "recognition_other_miss";

            Eigen::RowVectorXd const hit = con.FirstOf(
                {{other_hit, self_hit}, {self_hit}, {other_hit}, {"recognition_other_no_response"}});
            Eigen::RowVectorXd const rejection =
                con.FirstOf({{"correct_rejection"}, {"false_alarm"}});
            Eigen::RowVectorXd const self_hits = con.FirstOf({{self_hit}, {self_miss}});
            Eigen::RowVectorXd const self =
                con.FirstOf({{self_hit, self_miss}, {self_miss}, {self_hit}});
            Eigen::RowVectorXd const other =
                con.FirstOf({{other_hit, other_miss}, {other_hit}, {other_miss}});
            Eigen::RowVectorXd const other_hits = con.FirstOf({{other_hit}, {other_miss}});
            return {{"encode_self-other", con["encode_self"] - con["encode_other"]},
                    {"encode_other", con["encode_other"]},
                    {"encode_self", con["encode_self"]},
                    {"instructions", con["instructions"]},
                    {"false_alarm", con["false_alarm"]},
                    {"recognition_hit", hit},
                    {"recognition_self_hit", self_hits},
                    {"recognition_hit-correct_rejection", hit - rejection},
                    {"correct_rejection", rejection},
                    {"recognition_self-other", self - other},
                    {"recognition_other_hit", other_hits}};
        }};
    return def;
}

ParadigmDefinition const &AudioDefinition() {
    static ParadigmDefinition const def{
        "audio",
        {"animal", "music", "nature", "speech", "tool", "voice", "animal-others",
         "music-others", "nature-others", "speech-others", "tool-others", "voice-others",
         "mean-silence", "animal-silence", "music-silence", "nature-silence", "speech-silence",
         "tool-silence", "voice-silence"},
        {"animal", "music", "nature", "speech", "tool", "voice", "silence"},
        [](Elementary const &con) -> ContrastMap {
            std::vector<std::string> const sounds{"animal", "music", "nature",
                                                  "speech", "tool",  "voice"};
            // Six categories over five, as the localizer has always been analysed
            Eigen::RowVectorXd others = Eigen::RowVectorXd::Zero(con.size());
            for (auto const &s : sounds) {
                others += con[s];
            }
            others /= 5.0;
            ContrastMap c{{"mean-silence", others - con["silence"]}};
            for (auto const &s : sounds) {
                c[s]              = con[s];
                c[s + "-others"]  = con[s] - others;
                c[s + "-silence"] = con[s] - con["silence"];
            }
            return c;
        }};
    return def;
}

ParadigmDefinition const &BangDefinition() {
    static ParadigmDefinition const def{
        "bang",
        {"talk", "no_talk", "talk-no_talk"},
        {"talk", "no_talk"},
        [](Elementary const &con) -> ContrastMap {
            return {{"talk", con["talk"]},
                    {"no_talk", con["no_talk"]},
                    {"talk-no_talk", con["talk"] - con["no_talk"]}};
        }};
    return def;
}

namespace {
ParadigmDefinition BiologicalMotionDefinition(std::string const &id, std::string const &kind) {
    std::string const upright  = kind + "_upright";
    std::string const inverted = kind + "_inverted";
    return ParadigmDefinition{
        id,
        {upright, inverted, "natural_upright", "natural_inverted",
         upright + " - natural_upright", upright + " - " + inverted,
         "natural_upright - natural_inverted"},
        {upright, inverted, "natural_upright", "natural_inverted"},
        [upright, inverted](Elementary const &con) -> ContrastMap {
            return {{upright, con[upright]},
                    {inverted, con[inverted]},
                    {"natural_upright", con["natural_upright"]},
                    {"natural_inverted", con["natural_inverted"]},
                    {upright + " - natural_upright", con[upright] - con["natural_upright"]},
                    {upright + " - " + inverted, con[upright] - con[inverted]},
                    {"natural_upright - natural_inverted",
                     con["natural_upright"] - con["natural_inverted"]}};
        }};
}
} // namespace

ParadigmDefinition const &BiologicalMotion1Definition() {
    static ParadigmDefinition const def = BiologicalMotionDefinition("biological_motion1", "global");
    return def;
}

ParadigmDefinition const &BiologicalMotion2Definition() {
    static ParadigmDefinition const def =
        BiologicalMotionDefinition("biological_motion2", "modified");
    return def;
}

ParadigmDefinition const &MathLanguageDefinition() {
    static ParadigmDefinition const def{
        "math_language",
        {"colorlessg", "control", "arithfact", "tom", "geomfact", "general", "arithprin",
         "context", "math-others", "geometry-arithmetics", "tom_and_context-general",
         "tom-general"},
        {"colorlessg", "control", "arithfact", "tom", "geomfact", "general", "arithprin",
         "context"},
        [](Elementary const &con) -> ContrastMap {
            ContrastMap c;
            for (auto const &l : MathLanguageDefinition().regressors) {
                c[l] = con[l];
            }
            c["math-others"] = con["arithprin"] + con["arithfact"] + con["geomfact"] -
                               con["tom"] - con["general"] - con["context"];
            c["geometry-arithmetics"] =
                con["geomfact"] - 0.5 * (con["arithprin"] + con["arithfact"]);
            c["tom_and_context-general"] = con["tom"] + con["context"] - 2.0 * con["general"];
            c["tom-general"]             = con["tom"] - con["general"];
            return c;
        }};
    return def;
}

ParadigmDefinition const &SpatialNavigationDefinition() {
    static ParadigmDefinition const def{
        "spatial_navigation",
        {"experimental", "pointing", "control"},
        {"experimental", "pointing_phase", "control"},
        [](Elementary const &con) -> ContrastMap {
            return {{"experimental", con["experimental"]},
                    {"pointing", con["pointing_phase"]},
                    {"control", con["control"]}};
        }};
    return def;
}

} // End namespace IBC
