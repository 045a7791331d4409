/*
 *  ArchiHcp.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include "Definitions.h"

namespace IBC {

ParadigmDefinition const &ArchiStandardDefinition() {
    static ParadigmDefinition const def{
        "archi_standard",
        {"audio_left_button_press", "audio_right_button_press", "video_left_button_press",
         "video_right_button_press", "left-right_button_press", "right-left_button_press",
         "listening-reading", "reading-listening", "motor-cognitive", "cognitive-motor",
         "reading-checkerboard", "horizontal-vertical", "vertical-horizontal",
         "horizontal_checkerboard", "vertical_checkerboard", "audio_sentence", "video_sentence",
         "audio_computation", "video_computation", "sentences", "computation",
         "computation-sentences", "sentences-computation"},
        {"audio_left_hand", "audio_right_hand", "video_left_hand", "video_right_hand",
         "audio_computation", "video_computation", "audio_sentence", "video_sentence",
         "horizontal_checkerboard", "vertical_checkerboard"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const audio = con["audio_left_hand"] + con["audio_right_hand"] +
                                             con["audio_computation"] + con["audio_sentence"];
            Eigen::RowVectorXd const video = con["video_left_hand"] + con["video_right_hand"] +
                                             con["video_computation"] + con["video_sentence"];
            Eigen::RowVectorXd const left  = con["audio_left_hand"] + con["video_left_hand"];
            Eigen::RowVectorXd const right = con["audio_right_hand"] + con["video_right_hand"];
            Eigen::RowVectorXd const computation =
                con["audio_computation"] + con["video_computation"];
            Eigen::RowVectorXd const sentences = con["audio_sentence"] + con["video_sentence"];
            Eigen::RowVectorXd const motor_cognitive = left + right - computation - sentences;
            auto const &             horizontal      = con["horizontal_checkerboard"];
            auto const &             vertical        = con["vertical_checkerboard"];
            return {{"audio_left_button_press", con["audio_left_hand"]},
                    {"audio_right_button_press", con["audio_right_hand"]},
                    {"video_left_button_press", con["video_left_hand"]},
                    {"video_right_button_press", con["video_right_hand"]},
                    {"left-right_button_press", left - right},
                    {"right-left_button_press", right - left},
                    {"listening-reading", audio - video},
                    {"reading-listening", video - audio},
                    {"motor-cognitive", motor_cognitive},
                    {"cognitive-motor", -motor_cognitive},
                    {"reading-checkerboard", con["video_sentence"] - horizontal},
                    {"horizontal-vertical", horizontal - vertical},
                    {"vertical-horizontal", vertical - horizontal},
                    {"horizontal_checkerboard", horizontal},
                    {"vertical_checkerboard", vertical},
                    {"audio_sentence", con["audio_sentence"]},
                    {"video_sentence", con["video_sentence"]},
                    {"audio_computation", con["audio_computation"]},
                    {"video_computation", con["video_computation"]},
                    {"sentences", sentences},
                    {"computation", computation},
                    {"computation-sentences", computation - sentences},
                    {"sentences-computation", sentences - computation}};
        }};
    return def;
}

ParadigmDefinition const &ArchiSocialDefinition() {
    static ParadigmDefinition const def{
        "archi_social",
        {"triangle_mental-random", "false_belief-mechanistic_audio", "mechanistic_audio",
         "false_belief-mechanistic_video", "mechanistic_video", "false_belief-mechanistic",
         "speech-non_speech", "triangle_mental", "triangle_random", "false_belief_audio",
         "false_belief_video", "speech_sound", "non_speech_sound"},
        {"triangle_intention", "triangle_random", "false_belief_audio", "mechanistic_audio",
         "false_belief_video", "mechanistic_video", "speech", "non_speech"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const belief_audio =
                con["false_belief_audio"] - con["mechanistic_audio"];
            Eigen::RowVectorXd const belief_video =
                con["false_belief_video"] - con["mechanistic_video"];
            return {{"triangle_mental", con["triangle_intention"]},
                    {"triangle_random", con["triangle_random"]},
                    {"false_belief_audio", con["false_belief_audio"]},
                    {"mechanistic_audio", con["mechanistic_audio"]},
                    {"false_belief_video", con["false_belief_video"]},
                    {"mechanistic_video", con["mechanistic_video"]},
                    {"speech_sound", con["speech"]},
                    {"non_speech_sound", con["non_speech"]},
                    {"triangle_mental-random", con["triangle_intention"] - con["triangle_random"]},
                    {"false_belief-mechanistic_audio", belief_audio},
                    {"false_belief-mechanistic_video", belief_video},
                    {"false_belief-mechanistic", belief_audio + belief_video},
                    {"speech-non_speech", con["speech"] - con["non_speech"]}};
        }};
    return def;
}

ParadigmDefinition const &ArchiSpatialDefinition() {
    static ParadigmDefinition const def{
        "archi_spatial",
        {"saccades", "rotation_hand", "rotation_side", "object_grasp", "object_orientation",
         "hand-side", "grasp-orientation"},
        {"saccade", "rotation_hand", "rotation_side", "object_grasp", "object_orientation"},
        [](Elementary const &con) -> ContrastMap {
            return {{"saccades", con["saccade"]},
                    {"rotation_hand", con["rotation_hand"]},
                    {"rotation_side", con["rotation_side"]},
                    {"object_grasp", con["object_grasp"]},
                    {"object_orientation", con["object_orientation"]},
                    {"hand-side", con["rotation_hand"] - con["rotation_side"]},
                    {"grasp-orientation", con["object_grasp"] - con["object_orientation"]}};
        }};
    return def;
}

ParadigmDefinition const &ArchiEmotionalDefinition() {
    static ParadigmDefinition const def{
        "archi_emotional",
        {"face_gender", "face_control", "face_trusty", "expression_intention",
         "expression_gender", "expression_control", "trusty_and_intention-control",
         "trusty_and_intention-gender", "expression_gender-control",
         "expression_intention-control", "expression_intention-gender", "face_trusty-control",
         "face_gender-control", "face_trusty-gender"},
        {"face_gender", "face_control", "face_trusty", "expression_intention",
         "expression_gender", "expression_control"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const trusty_gender = con["face_trusty"] - con["face_gender"];
            Eigen::RowVectorXd const trusty_control = con["face_trusty"] - con["face_control"];
            Eigen::RowVectorXd const intention_gender =
                con["expression_intention"] - con["expression_gender"];
            Eigen::RowVectorXd const intention_control =
                con["expression_intention"] - con["expression_control"];
            return {{"face_gender", con["face_gender"]},
                    {"face_control", con["face_control"]},
                    {"face_trusty", con["face_trusty"]},
                    {"expression_intention", con["expression_intention"]},
                    {"expression_gender", con["expression_gender"]},
                    {"expression_control", con["expression_control"]},
                    {"face_trusty-gender", trusty_gender},
                    {"face_gender-control", con["face_gender"] - con["face_control"]},
                    {"face_trusty-control", trusty_control},
                    {"expression_intention-gender", intention_gender},
                    {"expression_intention-control", intention_control},
                    {"expression_gender-control",
                     con["expression_gender"] - con["expression_control"]},
                    {"trusty_and_intention-gender", trusty_gender + intention_gender},
                    {"trusty_and_intention-control", trusty_control + intention_control}};
        }};
    return def;
}

/*
 * The HCP first-level designs carry capitalised condition names, so these all match
 * labels case-insensitively.
 */
ParadigmDefinition const &HcpEmotionDefinition() {
    static ParadigmDefinition const def{
        "hcp_emotion",
        {"face", "shape", "face-shape", "shape-face"},
        {"face", "shape"},
        [](Elementary const &con) -> ContrastMap {
            return {{"face", con["face"]},
                    {"shape", con["shape"]},
                    {"face-shape", con["face"] - con["shape"]},
                    {"shape-face", con["shape"] - con["face"]}};
        },
        true};
    return def;
}

ParadigmDefinition const &HcpGamblingDefinition() {
    static ParadigmDefinition const def{
        "hcp_gambling",
        {"punishment-reward", "reward-punishment", "punishment", "reward"},
        {"punishment", "reward"},
        [](Elementary const &con) -> ContrastMap {
            return {{"punishment", con["punishment"]},
                    {"reward", con["reward"]},
                    {"punishment-reward", con["punishment"] - con["reward"]},
                    {"reward-punishment", con["reward"] - con["punishment"]}};
        },
        true};
    return def;
}

ParadigmDefinition const &HcpLanguageDefinition() {
    static ParadigmDefinition const def{
        "hcp_language",
        {"math-story", "story-math", "math", "story"},
        {"math", "story"},
        [](Elementary const &con) -> ContrastMap {
            return {{"math", con["math"]},
                    {"story", con["story"]},
                    {"math-story", con["math"] - con["story"]},
                    {"story-math", con["story"] - con["math"]}};
        },
        true};
    return def;
}

ParadigmDefinition const &HcpMotorDefinition() {
    static ParadigmDefinition const def{
        "hcp_motor",
        {"left_hand", "right_hand", "left_foot", "right_foot", "tongue", "tongue-avg",
         "left_hand-avg", "right_hand-avg", "left_foot-avg", "right_foot-avg", "cue"},
        {"cue", "left_hand", "right_hand", "left_foot", "right_foot", "tongue"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const average = (con["left_hand"] + con["right_hand"] +
                                                con["left_foot"] + con["right_foot"] +
                                                con["tongue"]) /
                                               5.0;
            return {{"cue", con["cue"]},
                    {"left_hand", con["left_hand"]},
                    {"right_hand", con["right_hand"]},
                    {"left_foot", con["left_foot"]},
                    {"right_foot", con["right_foot"]},
                    {"tongue", con["tongue"]},
                    {"left_hand-avg", con["left_hand"] - average},
                    {"right_hand-avg", con["right_hand"] - average},
                    {"left_foot-avg", con["left_foot"] - average},
                    {"right_foot-avg", con["right_foot"] - average},
                    {"tongue-avg", con["tongue"] - average}};
        },
        true};
    return def;
}

ParadigmDefinition const &HcpWmDefinition() {
    static ParadigmDefinition const def{
        "hcp_wm",
        {"2back-0back", "0back-2back", "body-avg", "face-avg", "place-avg", "tools-avg",
         "0back_body", "2back_body", "0back_face", "2back_face", "0back_tools", "2back_tools",
         "0back_place", "2back_place"},
        {"2back_body", "0back_body", "2back_face", "0back_face", "2back_tools", "0back_tools",
         "0back_place", "2back_place"},
        [](Elementary const &con) -> ContrastMap {
            Eigen::RowVectorXd const back2 =
                con["2back_body"] + con["2back_face"] + con["2back_tools"] + con["2back_place"];
            Eigen::RowVectorXd const back0 =
                con["0back_body"] + con["0back_face"] + con["0back_tools"] + con["0back_place"];
            Eigen::RowVectorXd const average = (back2 + back0) / 8.0;
            Eigen::RowVectorXd const body    = (con["2back_body"] + con["0back_body"]) / 2.0;
            Eigen::RowVectorXd const face    = (con["2back_face"] + con["0back_face"]) / 2.0;
            Eigen::RowVectorXd const place   = (con["2back_place"] + con["0back_place"]) / 2.0;
            Eigen::RowVectorXd const tools   = (con["2back_tools"] + con["0back_tools"]) / 2.0;
            return {{"0back_body", con["0back_body"]},
                    {"2back_body", con["2back_body"]},
                    {"0back_face", con["0back_face"]},
                    {"2back_face", con["2back_face"]},
                    {"0back_tools", con["0back_tools"]},
                    {"2back_tools", con["2back_tools"]},
                    {"0back_place", con["0back_place"]},
                    {"2back_place", con["2back_place"]},
                    {"2back-0back", back2 - back0},
                    {"0back-2back", back0 - back2},
                    {"body-avg", body - average},
                    {"face-avg", face - average},
                    {"place-avg", place - average},
                    {"tools-avg", tools - average}};
        },
        true};
    return def;
}

ParadigmDefinition const &HcpRelationalDefinition() {
    static ParadigmDefinition const def{
        "hcp_relational",
        {"relational", "relational-match", "match"},
        {"relational", "control"},
        [](Elementary const &con) -> ContrastMap {
            return {{"match", con["control"]},
                    {"relational", con["relational"]},
                    {"relational-match", con["relational"] - con["control"]}};
        },
        true};
    return def;
}

ParadigmDefinition const &HcpSocialDefinition() {
    static ParadigmDefinition const def{
        "hcp_social",
        {"mental-random", "mental", "random"},
        {"mental", "random"},
        [](Elementary const &con) -> ContrastMap {
            return {{"mental", con["mental"]},
                    {"random", con["random"]},
                    {"mental-random", con["mental"] - con["random"]}};
        },
        true};
    return def;
}

} // End namespace IBC
