/*
 *  test_design.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <gtest/gtest.h>

#include "Design.h"
#include "Exceptions.h"

TEST(Encode, LevelsAreSorted) {
    auto const enc = IBC::Encode({"sub-04", "sub-01", "sub-04", "sub-02"});
    ASSERT_EQ(enc.levels, (std::vector<std::string>{"sub-01", "sub-02", "sub-04"}));
    Eigen::MatrixXd expected(4, 3);
    expected << 0, 0, 1, //
        1, 0, 0,         //
        0, 0, 1,         //
        0, 1, 0;
    EXPECT_EQ(enc.matrix, expected);
}

class ThreeFactors : public ::testing::Test {
  protected:
    IBC::FactorDesign design{{{"subject", {"s1", "s2", "s1", "s2", "s1", "s2"}},
                              {"contrast", {"a", "a", "b", "b", "c", "c"}},
                              {"acquisition", {"ap", "pa", "pa", "ap", "ap", "pa"}}}};
};

TEST_F(ThreeFactors, ColumnsDropLastLevel) {
    EXPECT_EQ(design.labels(),
              (std::vector<std::string>{"s1", "a", "b", "ap", "intercept"}));
    EXPECT_EQ(design.matrix().rows(), 6);
    EXPECT_EQ(design.matrix().cols(), 5);
    EXPECT_EQ(design.factors(), 3u);
    EXPECT_EQ(design.name(1), "contrast");
    EXPECT_EQ(design.levels(1), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(design.dof(0), 1);
    EXPECT_EQ(design.dof(1), 2);
    EXPECT_EQ(design.dof(2), 1);
}

TEST_F(ThreeFactors, Rows) {
    Eigen::RowVectorXd first(5), last(5);
    first << 1, 1, 0, 1, 1;
    last << 0, 0, 0, 0, 1;
    EXPECT_EQ(Eigen::RowVectorXd(design.matrix().row(0)), first);
    EXPECT_EQ(Eigen::RowVectorXd(design.matrix().row(5)), last);
    EXPECT_TRUE((design.matrix().col(4).array() == 1.0).all());
}

TEST_F(ThreeFactors, FactorContrasts) {
    Eigen::MatrixXd expected = Eigen::MatrixXd::Zero(2, 5);
    expected(0, 1)           = 1.0;
    expected(1, 2)           = 1.0;
    EXPECT_EQ(design.contrast(1), expected);
    Eigen::MatrixXd acq = Eigen::MatrixXd::Zero(1, 5);
    acq(0, 3)           = 1.0;
    EXPECT_EQ(design.contrast(2), acq);
}

TEST_F(ThreeFactors, FullRank) {
    EXPECT_FALSE(design.degenerate());
    EXPECT_GT(design.smallestSingularValue(), 0.0);
    EXPECT_GE(design.largestSingularValue(), design.smallestSingularValue());
}

TEST(FactorDesign, ConfoundedFactorsAreDegenerate) {
    IBC::FactorDesign const d{{{"subject", {"s1", "s1", "s2", "s2"}},
                               {"contrast", {"a", "a", "b", "b"}}}};
    EXPECT_TRUE(d.degenerate());
}

TEST(FactorDesign, SingleLevelFactorIsRejected) {
    EXPECT_THROW(IBC::FactorDesign({{"subject", {"s1", "s2"}}, {"acquisition", {"ap", "ap"}}}),
                 IBC::DesignError);
}

TEST(FactorDesign, FactorsMustHaveEqualLength) {
    EXPECT_THROW(IBC::FactorDesign({{"subject", {"s1", "s2", "s3"}}, {"contrast", {"a", "b"}}}),
                 IBC::DesignError);
    EXPECT_THROW(IBC::FactorDesign(std::vector<IBC::Factor>{}), IBC::DesignError);
}
