/*
 *  test_dispatcher.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <set>

#include <gtest/gtest.h>

#include "Exceptions.h"
#include "Paradigm.h"

using IBC::Columns;
using IBC::ContrastMap;

namespace {
void ExpectSameContrasts(ContrastMap const &a, ContrastMap const &b) {
    ASSERT_EQ(a.size(), b.size());
    for (auto const &kv : a) {
        ASSERT_EQ(b.count(kv.first), 1u) << kv.first;
        EXPECT_EQ(kv.second, b.at(kv.first)) << kv.first;
    }
}
} // namespace

TEST(Dispatcher, WedgeDirectionsShareOneDesign) {
    Columns const cols{"lower_meridian", "lower_right", "right_meridian", "upper_right",
                       "upper_meridian", "upper_left",  "left_meridian",  "lower_left",
                       "constant"};
    auto const wedge = IBC::MakeContrasts("wedge", cols);
    EXPECT_EQ(wedge.size(), 9u);
    ExpectSameContrasts(wedge, IBC::MakeContrasts("wedge_anti", cols));
    ExpectSameContrasts(wedge, IBC::MakeContrasts("wedge_clock", cols));
}

TEST(Dispatcher, RingVariantsShareOneDesign) {
    Columns const cols{"foveal", "middle", "peripheral"};
    auto const    ring = IBC::MakeContrasts("ring", cols);
    ExpectSameContrasts(ring, IBC::MakeContrasts("cont_ring", cols));
    ExpectSameContrasts(ring, IBC::MakeContrasts("exp_ring", cols));
    EXPECT_EQ(IBC::ParseParadigm("exp_ring"), IBC::Paradigm::Ring);
}

TEST(Dispatcher, PreferencePluralsAreAliases) {
    for (std::string const domain : {"painting", "house", "face", "food"}) {
        EXPECT_EQ(IBC::ParseParadigm("preference_" + domain),
                  IBC::ParseParadigm("preference_" + domain + "s"));
        Columns const cols{domain + "_constant", domain + "_linear", domain + "_quadratic"};
        ExpectSameContrasts(IBC::MakeContrasts("preference_" + domain, cols),
                            IBC::MakeContrasts("preference_" + domain + "s", cols));
    }
}

TEST(Dispatcher, MttAxes) {
    EXPECT_EQ(IBC::ParseParadigm("MTTWE"), IBC::Paradigm::MttWestEast);
    EXPECT_EQ(IBC::ParseParadigm("MTTNS"), IBC::Paradigm::MttSouthNorth);
    EXPECT_EQ(IBC::Definition(IBC::Paradigm::MttWestEast).id, "MTTWE");
    EXPECT_EQ(IBC::ContrastSchema("MTTWE").count("westside-eastside_event"), 1u);
    EXPECT_EQ(IBC::ContrastSchema("MTTNS").count("sn_average_event"), 1u);
}

TEST(Dispatcher, UnknownIdentifier) {
    try {
        IBC::MakeContrasts("retino", {"a"});
        FAIL() << "Expected UnknownParadigm";
    } catch (IBC::UnknownParadigm &e) {
        EXPECT_EQ(e.identifier(), "retino");
        EXPECT_NE(std::string(e.what()).find("retino"), std::string::npos);
    }
    EXPECT_THROW(IBC::ParseParadigm("Wedge"), IBC::UnknownParadigm);
    EXPECT_THROW(IBC::ContrastSchema(""), IBC::UnknownParadigm);
}

TEST(Dispatcher, IdentifiersAreConsistent) {
    auto const            ids = IBC::ListParadigms();
    std::set<std::string> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), ids.size());
    EXPECT_EQ(ids.size(), IBC::IdentifierTable().size());

    size_t routed = 0;
    for (auto const p : IBC::AllParadigms()) {
        auto const aliases = IBC::Identifiers(p);
        ASSERT_FALSE(aliases.empty());
        for (auto const &id : aliases) {
            EXPECT_EQ(IBC::ParseParadigm(id), p) << id;
        }
        routed += aliases.size();
    }
    EXPECT_EQ(routed, ids.size());
    EXPECT_EQ(IBC::Identifiers(IBC::Paradigm::Wedge).size(), 3u);
}

TEST(Dispatcher, EveryParadigmHasADefinition) {
    std::set<std::string> seen;
    for (auto const p : IBC::AllParadigms()) {
        auto const &def = IBC::Definition(p);
        EXPECT_FALSE(def.id.empty());
        EXPECT_TRUE(static_cast<bool>(def.compute)) << def.id;
        EXPECT_TRUE(seen.insert(def.id).second) << def.id;
    }
    EXPECT_EQ(IBC::AllParadigms().size(), 51u);
}

TEST(Dispatcher, SchemaMatchesContrasts) {
    Columns const cols{"go", "stop", "ignore"};
    auto const    schema    = IBC::ContrastSchema("selective_stop_signal");
    auto const    contrasts = IBC::MakeContrasts("selective_stop_signal", cols);
    for (auto const &kv : schema) {
        EXPECT_EQ(contrasts.count(kv.first), 1u) << kv.first;
    }
    EXPECT_EQ(contrasts.size(), schema.size() + 1);
}
