/*
 *  test_elementary.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <gtest/gtest.h>

#include "Elementary.h"
#include "Exceptions.h"

using IBC::Columns;
using IBC::ContrastMap;

namespace {
Eigen::RowVectorXd Row(std::initializer_list<double> values) {
    Eigen::RowVectorXd r(values.size());
    Eigen::Index       i = 0;
    for (auto const v : values) {
        r[i++] = v;
    }
    return r;
}
} // namespace

TEST(ElementaryContrasts, OneBasisVectorPerColumn) {
    auto const con = IBC::ElementaryContrasts({"a", "b", "c"});
    ASSERT_EQ(con.size(), 3u);
    EXPECT_EQ(con.at("a"), Row({1, 0, 0}));
    EXPECT_EQ(con.at("b"), Row({0, 1, 0}));
    EXPECT_EQ(con.at("c"), Row({0, 0, 1}));
}

TEST(ElementaryContrasts, NuisanceLabels) {
    EXPECT_TRUE(IBC::IsNuisance("constant"));
    EXPECT_TRUE(IBC::IsNuisance("rz"));
    EXPECT_TRUE(IBC::IsNuisance("drift_0"));
    EXPECT_TRUE(IBC::IsNuisance("drift_19"));
    EXPECT_TRUE(IBC::IsNuisance("conf_7"));
    EXPECT_FALSE(IBC::IsNuisance("drift_20"));
    EXPECT_FALSE(IBC::IsNuisance("face"));
}

TEST(ElementaryContrasts, DerivativeLabels) {
    EXPECT_TRUE(IBC::IsDerivative("a_derivative"));
    EXPECT_FALSE(IBC::IsDerivative("_derivative"));
    EXPECT_FALSE(IBC::IsDerivative("derivative_a"));
    EXPECT_FALSE(IBC::IsDerivative("a"));
}

TEST(Extenders, EffectsOfInterestSkipsNuisance) {
    Columns const cols{"a", "b", "constant", "drift_0"};
    ContrastMap   contrasts;
    IBC::AppendEffectsOfInterest(cols, contrasts);
    ASSERT_EQ(contrasts.count(IBC::EffectsInterestKey), 1u);
    auto const &eoi = contrasts.at(IBC::EffectsInterestKey);
    ASSERT_EQ(eoi.rows(), 2);
    EXPECT_EQ(Eigen::RowVectorXd(eoi.row(0)), Row({1, 0, 0, 0}));
    EXPECT_EQ(Eigen::RowVectorXd(eoi.row(1)), Row({0, 1, 0, 0}));
}

TEST(Extenders, EffectsOfInterestSkipsDerivatives) {
    ContrastMap contrasts;
    IBC::AppendEffectsOfInterest({"a", "a_derivative", "b", "tx"}, contrasts);
    ASSERT_EQ(contrasts.at(IBC::EffectsInterestKey).rows(), 2);
}

TEST(Extenders, Derivatives) {
    Columns const cols{"a", "a_derivative", "b"};
    ContrastMap   contrasts;
    IBC::AppendDerivatives(cols, contrasts);
    ASSERT_EQ(contrasts.count(IBC::DerivativesKey), 1u);
    auto const &d = contrasts.at(IBC::DerivativesKey);
    ASSERT_EQ(d.rows(), 1);
    EXPECT_EQ(Eigen::RowVectorXd(d.row(0)), Row({0, 1, 0}));
}

TEST(Extenders, NothingAddedWhenEmpty) {
    ContrastMap contrasts;
    IBC::AppendDerivatives({"a", "b"}, contrasts);
    IBC::AppendEffectsOfInterest({"constant", "drift_0", "drift_1"}, contrasts);
    EXPECT_TRUE(contrasts.empty());
}

TEST(Extenders, Idempotent) {
    Columns const cols{"a", "a_derivative", "b", "b_derivative", "constant"};
    ContrastMap   once{{"a-b", Row({1, 0, -1, 0, 0})}};
    IBC::AppendDerivatives(cols, once);
    IBC::AppendEffectsOfInterest(cols, once);
    ContrastMap twice = once;
    IBC::AppendDerivatives(cols, twice);
    IBC::AppendEffectsOfInterest(cols, twice);
    ASSERT_EQ(once.size(), twice.size());
    for (auto const &kv : once) {
        EXPECT_EQ(kv.second, twice.at(kv.first)) << kv.first;
    }
}

TEST(Elementary, LookupAndMissing) {
    IBC::Elementary const con({"go", "stop"});
    EXPECT_EQ(con.size(), 2);
    EXPECT_TRUE(con.has("go"));
    EXPECT_FALSE(con.has("ignore"));
    EXPECT_EQ(con["stop"], Row({0, 1}));
    try {
        con["ignore"];
        FAIL() << "Expected MissingRegressor";
    } catch (IBC::MissingRegressor &e) {
        EXPECT_EQ(e.label(), "ignore");
    }
}

TEST(Elementary, CaseFolding) {
    IBC::Elementary const folded({"Face", "SHAPE"}, true);
    EXPECT_EQ(folded["face"], Row({1, 0}));
    EXPECT_EQ(folded["Shape"], Row({0, 1}));
    IBC::Elementary const exact({"Face", "SHAPE"});
    EXPECT_THROW(exact["face"], IBC::MissingRegressor);
}

TEST(Elementary, DuplicateLabelsRejected) {
    EXPECT_THROW(IBC::Elementary({"a", "b", "a"}), IBC::DesignError);
    EXPECT_THROW(IBC::Elementary({"Face", "face"}, true), IBC::DesignError);
    EXPECT_NO_THROW(IBC::Elementary({"Face", "face"}, false));
}

TEST(Elementary, FirstOfTakesFirstCompleteCandidate) {
    IBC::Elementary const con({"x", "y", "z"});
    EXPECT_EQ(con.FirstOf({{"x", "w"}, {"y", "z"}, {"x"}}), Row({0, 1, 1}));
    EXPECT_EQ(con.FirstOf({{"w"}, {"z"}}), Row({0, 0, 1}));
    EXPECT_THROW(con.FirstOf({{"v"}, {"w"}}), IBC::MissingRegressor);
}

TEST(Polynomials, SixLevels) {
    auto const p = IBC::OrthogonalPolynomials(6);
    Eigen::VectorXd linear(6);
    linear << -1, -0.6, -0.2, 0.2, 0.6, 1;
    EXPECT_TRUE(p.linear.isApprox(linear));
    EXPECT_TRUE(p.constant.isApprox(Eigen::VectorXd::Ones(6)));
    Eigen::VectorXd const sq = linear.array().square();
    EXPECT_TRUE(p.quadratic.isApprox((sq.array() - sq.mean()).matrix()));
    EXPECT_NEAR(p.quadratic.sum(), 0.0, 1e-12);
}

TEST(Polynomials, ContrastsAreDotProducts) {
    Columns const cols{"constant", "r1", "r2", "r3"};
    IBC::Elementary const con(cols);
    ContrastMap           c;
    IBC::AddPolynomialContrasts("task", {"r1", "r2", "r3"}, con, c);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_TRUE(c.at("task_constant").isApprox(Row({0, 1, 1, 1})));
    EXPECT_TRUE(c.at("task_linear").isApprox(Row({0, -1, 0, 1})));
    EXPECT_TRUE(c.at("task_quadratic").isApprox(Row({0, 1. / 3, -2. / 3, 1. / 3})));
}
