/*
 *  test_paradigms.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <set>

#include <gtest/gtest.h>

#include "Definitions.h"
#include "Exceptions.h"
#include "Paradigm.h"

using IBC::Columns;
using IBC::ContrastMap;

namespace {
// A first-level design as it comes out of the GLM: task regressors plus confounds
Columns WithNuisance(std::vector<std::string> const &regressors) {
    Columns cols = regressors;
    cols.insert(cols.end(), {"tx", "ty", "tz", "rx", "ry", "rz", "drift_0", "drift_1", "constant"});
    return cols;
}

Eigen::RowVectorXd Coefficients(ContrastMap const &c, std::string const &name) {
    return c.at(name).row(0);
}

double At(ContrastMap const &c, std::string const &name, Columns const &cols, std::string const &col) {
    auto const it = std::find(cols.begin(), cols.end(), col);
    return c.at(name)(0, std::distance(cols.begin(), it));
}
} // namespace

TEST(Paradigms, EveryDefinitionProducesItsDeclaredNames) {
    for (auto const p : IBC::AllParadigms()) {
        auto const &def  = IBC::Definition(p);
        auto const  cols = WithNuisance(def.regressors);
        ContrastMap contrasts;
        ASSERT_NO_THROW(contrasts = IBC::Evaluate(def, cols)) << def.id;

        std::set<std::string> expected(def.names.begin(), def.names.end());
        if (def.extend && !def.regressors.empty()) {
            expected.insert(IBC::EffectsInterestKey);
        }
        std::set<std::string> got;
        for (auto const &kv : contrasts) {
            got.insert(kv.first);
            EXPECT_EQ(kv.second.cols(), static_cast<Eigen::Index>(cols.size()))
                << def.id << " " << kv.first;
        }
        EXPECT_EQ(got, expected) << def.id;
        if (def.extend && !def.regressors.empty()) {
            EXPECT_EQ(contrasts.at(IBC::EffectsInterestKey).rows(),
                      static_cast<Eigen::Index>(def.regressors.size()))
                << def.id;
        }
    }
}

TEST(Paradigms, DerivativeColumnsAddDerivativesContrast) {
    Columns const cols{"go", "go_derivative", "stop", "stop_derivative", "constant"};
    auto const    c = IBC::MakeContrasts("stop_signal", cols);
    ASSERT_EQ(c.count(IBC::DerivativesKey), 1u);
    EXPECT_EQ(c.at(IBC::DerivativesKey).rows(), 2);
    EXPECT_EQ(c.at(IBC::EffectsInterestKey).rows(), 2);
}

TEST(Paradigms, SchemaListsDeclaredNames) {
    auto const &def    = IBC::StroopDefinition();
    auto const  schema = IBC::Schema(def);
    ASSERT_EQ(schema.size(), std::set<std::string>(def.names.begin(), def.names.end()).size());
    for (auto const &name : def.names) {
        ASSERT_EQ(schema.count(name), 1u) << name;
        EXPECT_EQ(schema.at(name).size(), 0);
    }
    EXPECT_EQ(schema.count(IBC::EffectsInterestKey), 0u);
}

TEST(Paradigms, StopSignal) {
    auto const c = IBC::MakeContrasts("stop_signal", {"go", "stop"});
    Eigen::RowVectorXd expected(2);
    expected << -1, 1;
    EXPECT_EQ(Coefficients(c, "stop-go"), expected);
    EXPECT_EQ(c.at(IBC::EffectsInterestKey).rows(), 2);
}

TEST(Paradigms, MissingRegressorIsReported) {
    try {
        IBC::MakeContrasts("stop_signal", {"go", "constant"});
        FAIL() << "Expected MissingRegressor";
    } catch (IBC::MissingRegressor &e) {
        EXPECT_EQ(e.label(), "stop");
    }
}

TEST(Paradigms, MismatchedNamesAreRejected) {
    IBC::ParadigmDefinition const broken{
        "broken", {"a", "b"}, {"a"}, [](IBC::Elementary const &con) -> ContrastMap {
            return {{"a", con["a"]}, {"c", con["a"]}};
        }};
    try {
        IBC::Evaluate(broken, {"a"});
        FAIL() << "Expected ContrastMismatch";
    } catch (IBC::ContrastMismatch &e) {
        std::string const what = e.what();
        EXPECT_NE(what.find("broken"), std::string::npos);
        EXPECT_NE(what.find("Missing: [b]"), std::string::npos);
        EXPECT_NE(what.find("Extra: [c]"), std::string::npos);
    }
}

TEST(Paradigms, VstmPolynomials) {
    Columns cols;
    for (int i = 1; i <= 6; i++) {
        cols.push_back("response_num_" + std::to_string(i));
    }
    cols.push_back("constant");
    auto const c = IBC::MakeContrasts("VSTM", cols);
    Eigen::RowVectorXd linear(7);
    linear << -1, -0.6, -0.2, 0.2, 0.6, 1, 0;
    EXPECT_TRUE(Coefficients(c, "vstm_linear").isApprox(linear));
    EXPECT_DOUBLE_EQ(Coefficients(c, "vstm_constant").sum(), 6.0);
    EXPECT_NEAR(Coefficients(c, "vstm_quadratic").sum(), 0.0, 1e-12);
    EXPECT_EQ(c.at(IBC::EffectsInterestKey).rows(), 6);
}

TEST(Paradigms, EnumerationUsesEightLevels) {
    Columns cols;
    for (int i = 1; i <= 8; i++) {
        cols.push_back("response_num_" + std::to_string(i));
    }
    auto const c = IBC::MakeContrasts("enumeration", cols);
    EXPECT_DOUBLE_EQ(Coefficients(c, "enumeration_linear")[0], -1.0);
    EXPECT_DOUBLE_EQ(Coefficients(c, "enumeration_linear")[7], 1.0);
    EXPECT_THROW(IBC::MakeContrasts("enumeration", {"response_num_1", "response_num_2"}),
                 IBC::MissingRegressor);
}

TEST(Paradigms, HcpMotorSubtractsAverage) {
    Columns const cols{"cue", "left_hand", "right_hand", "left_foot", "right_foot", "tongue"};
    auto const    c = IBC::MakeContrasts("hcp_motor", cols);
    Eigen::RowVectorXd expected(6);
    expected << 0, 0.8, -0.2, -0.2, -0.2, -0.2;
    EXPECT_TRUE(Coefficients(c, "left_hand-avg").isApprox(expected));
    EXPECT_NEAR(Coefficients(c, "tongue-avg").sum(), 0.0, 1e-12);
}

TEST(Paradigms, HcpLabelsMatchIgnoringCase) {
    auto const c = IBC::MakeContrasts("hcp_emotion", {"Face", "SHAPE", "constant"});
    Eigen::RowVectorXd expected(3);
    expected << 1, -1, 0;
    EXPECT_EQ(Coefficients(c, "face-shape"), expected);
    EXPECT_THROW(IBC::MakeContrasts("archi_spatial",
                                    {"Saccade", "rotation_hand", "rotation_side", "object_grasp",
                                     "object_orientation"}),
                 IBC::MissingRegressor);
}

TEST(Paradigms, HcpWorkingMemory) {
    auto const &def  = IBC::HcpWmDefinition();
    auto const  cols = def.regressors;
    auto const  c    = IBC::Evaluate(def, cols);
    EXPECT_DOUBLE_EQ(At(c, "body-avg", cols, "2back_body"), 0.5 - 1.0 / 8.0);
    EXPECT_DOUBLE_EQ(At(c, "body-avg", cols, "0back_face"), -1.0 / 8.0);
    EXPECT_DOUBLE_EQ(At(c, "2back-0back", cols, "2back_place"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "2back-0back", cols, "0back_tools"), -1.0);
}

TEST(Paradigms, LyonMotoFixationBaseline) {
    auto const &def  = IBC::LyonMotoDefinition();
    auto const  cols = def.regressors;
    auto const  c    = IBC::Evaluate(def, cols);
    EXPECT_DOUBLE_EQ(At(c, "finger_left-fixation", cols, "finger_left"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "finger_left-fixation", cols, "fixation_left"), -0.5);
    EXPECT_DOUBLE_EQ(At(c, "finger_left-fixation", cols, "fixation_right"), -0.5);
    EXPECT_DOUBLE_EQ(At(c, "saccade-fixation", cols, "saccade_right"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "saccade-fixation", cols, "fixation_left"), -1.0);
    EXPECT_NEAR(Coefficients(c, "tongue-fixation").sum(), 0.0, 1e-12);
}

TEST(Paradigms, AudioOthersOverFive) {
    auto const &def  = IBC::AudioDefinition();
    auto const  cols = def.regressors;
    auto const  c    = IBC::Evaluate(def, cols);
    EXPECT_DOUBLE_EQ(At(c, "animal-others", cols, "animal"), 0.8);
    EXPECT_DOUBLE_EQ(At(c, "animal-others", cols, "music"), -0.2);
    EXPECT_DOUBLE_EQ(At(c, "animal-others", cols, "silence"), 0.0);
    EXPECT_DOUBLE_EQ(At(c, "mean-silence", cols, "voice"), 0.2);
    EXPECT_DOUBLE_EQ(At(c, "mean-silence", cols, "silence"), -1.0);
}

TEST(Paradigms, SelfFallsBackToAvailableResponses) {
    Columns const cols{"encode_self", "encode_other", "instructions", "false_alarm",
                       "recognition_self_miss", "recognition_other_hit",
                       "recognition_other_miss"};
    auto const c = IBC::MakeContrasts("self", cols);
    EXPECT_DOUBLE_EQ(At(c, "correct_rejection", cols, "false_alarm"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_other_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self_hit", cols, "recognition_self_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit-correct_rejection", cols, "false_alarm"), -1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_self_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_hit"), -1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_miss"), -1.0);
}

TEST(Paradigms, SelfFullDesignContrastsSelfAgainstOther) {
    Columns const cols{"encode_self", "encode_other", "instructions", "false_alarm",
                       "correct_rejection", "recognition_self_hit", "recognition_self_miss",
                       "recognition_other_hit", "recognition_other_miss"};
    auto const c = IBC::MakeContrasts("self", cols);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_self_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_self_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_hit"), -1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_miss"), -1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_self_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_other_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self_hit", cols, "recognition_self_miss"), 0.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_other_hit", cols, "recognition_other_miss"), 0.0);
    EXPECT_DOUBLE_EQ(At(c, "correct_rejection", cols, "false_alarm"), 0.0);
}

TEST(Paradigms, SelfOnlyMissesFallsBackToNoResponse) {
    Columns const cols{"encode_self", "encode_other", "instructions", "false_alarm",
                       "correct_rejection", "recognition_self_miss", "recognition_other_miss",
                       "recognition_other_no_response"};
    auto const c = IBC::MakeContrasts("self", cols);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_other_no_response"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_self_miss"), 0.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit-correct_rejection", cols, "correct_rejection"), -1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self_hit", cols, "recognition_self_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_other_hit", cols, "recognition_other_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_self_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_miss"), -1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_no_response"), 0.0);
}

TEST(Paradigms, SelfMixedHitsAndMisses) {
    Columns const cols{"encode_self", "encode_other", "instructions", "false_alarm",
                       "correct_rejection", "recognition_self_hit", "recognition_other_miss"};
    auto const c = IBC::MakeContrasts("self", cols);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_self_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_hit", cols, "recognition_other_miss"), 0.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self_hit", cols, "recognition_self_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_other_hit", cols, "recognition_other_miss"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_self_hit"), 1.0);
    EXPECT_DOUBLE_EQ(At(c, "recognition_self-other", cols, "recognition_other_miss"), -1.0);
}

TEST(Paradigms, SelfWithoutAnyHitFails) {
    Columns const cols{"encode_self", "encode_other", "instructions", "false_alarm",
                       "correct_rejection", "recognition_self_miss", "recognition_other_miss"};
    EXPECT_THROW(IBC::MakeContrasts("self", cols), IBC::MissingRegressor);
}

TEST(Paradigms, ClipsTrainingIsEmpty) {
    auto const c = IBC::MakeContrasts("clips_trn", {"a", "b", "constant"});
    EXPECT_TRUE(c.empty());
    EXPECT_TRUE(IBC::ContrastSchema("clips_trn").empty());
}

TEST(Paradigms, MttKeepsOnlyDeclaredNames) {
    auto const &def = IBC::MttDefinition("sn");
    auto const  c   = IBC::Evaluate(def, def.regressors);
    EXPECT_EQ(c.size(), def.names.size() + 1);
    EXPECT_EQ(c.count("southside-northside_event"), 1u);
    EXPECT_EQ(c.count("northside-southside_event"), 1u);
    EXPECT_EQ(c.count("sn_all_event_response"), 1u);
    EXPECT_THROW(IBC::MttDefinition("ud"), IBC::UnknownParadigm);
}
