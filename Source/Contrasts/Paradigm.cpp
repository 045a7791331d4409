/*
 *  Paradigm.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <algorithm>
#include <set>

#include "Definitions.h"
#include "Exceptions.h"
#include "Paradigm.h"

namespace IBC {

std::vector<std::pair<std::string, Paradigm>> const &IdentifierTable() {
    static std::vector<std::pair<std::string, Paradigm>> const table{
        {"archi_standard", Paradigm::ArchiStandard},
        {"archi_social", Paradigm::ArchiSocial},
        {"archi_spatial", Paradigm::ArchiSpatial},
        {"archi_emotional", Paradigm::ArchiEmotional},
        {"hcp_emotion", Paradigm::HcpEmotion},
        {"hcp_gambling", Paradigm::HcpGambling},
        {"hcp_language", Paradigm::HcpLanguage},
        {"hcp_motor", Paradigm::HcpMotor},
        {"hcp_wm", Paradigm::HcpWm},
        {"hcp_relational", Paradigm::HcpRelational},
        {"hcp_social", Paradigm::HcpSocial},
        {"language", Paradigm::RsvpLanguage},
        {"colour", Paradigm::Colour},
        // Retinotopy runs in both directions share one design
        {"wedge", Paradigm::Wedge},
        {"wedge_anti", Paradigm::Wedge},
        {"wedge_clock", Paradigm::Wedge},
        {"ring", Paradigm::Ring},
        {"cont_ring", Paradigm::Ring},
        {"exp_ring", Paradigm::Ring},
        {"preference_painting", Paradigm::PreferencePainting},
        {"preference_paintings", Paradigm::PreferencePainting},
        {"preference_house", Paradigm::PreferenceHouse},
        {"preference_houses", Paradigm::PreferenceHouse},
        {"preference_face", Paradigm::PreferenceFace},
        {"preference_faces", Paradigm::PreferenceFace},
        {"preference_food", Paradigm::PreferenceFood},
        {"preference_foods", Paradigm::PreferenceFood},
        {"MTTWE", Paradigm::MttWestEast},
        {"MTTNS", Paradigm::MttSouthNorth},
        {"emotional_pain", Paradigm::EmotionalPain},
        {"pain_movie", Paradigm::PainMovie},
        {"theory_of_mind", Paradigm::TheoryOfMind},
        {"VSTM", Paradigm::Vstm},
        {"enumeration", Paradigm::Enumeration},
        {"clips_trn", Paradigm::ClipsTraining},
        {"self", Paradigm::SelfLocalizer},
        {"lyon_moto", Paradigm::LyonMoto},
        {"lyon_mcse", Paradigm::LyonMcse},
        {"lyon_mveb", Paradigm::LyonMveb},
        {"lyon_mvis", Paradigm::LyonMvis},
        {"lyon_lec1", Paradigm::LyonLec1},
        {"lyon_lec2", Paradigm::LyonLec2},
        {"lyon_audi", Paradigm::LyonAudi},
        {"lyon_visu", Paradigm::LyonVisu},
        {"audio", Paradigm::Audio},
        {"bang", Paradigm::Bang},
        {"selective_stop_signal", Paradigm::SelectiveStopSignal},
        {"stop_signal", Paradigm::StopSignal},
        {"stroop", Paradigm::Stroop},
        {"discount", Paradigm::Discount},
        {"attention", Paradigm::Attention},
        {"ward_and_aliport", Paradigm::WardAndAllport},
        {"two_by_two", Paradigm::TwoByTwo},
        {"columbia_cards", Paradigm::ColumbiaCards},
        {"dot_patterns", Paradigm::DotPatterns},
        {"biological_motion1", Paradigm::BiologicalMotion1},
        {"biological_motion2", Paradigm::BiologicalMotion2},
        {"math_language", Paradigm::MathLanguage},
        {"spatial_navigation", Paradigm::SpatialNavigation}};
    return table;
}

std::vector<Paradigm> const &AllParadigms() {
    static std::vector<Paradigm> const all = [] {
        std::vector<Paradigm> v;
        for (auto const &entry : IdentifierTable()) {
            if (std::find(v.begin(), v.end(), entry.second) == v.end()) {
                v.push_back(entry.second);
            }
        }
        return v;
    }();
    return all;
}

Paradigm ParseParadigm(std::string const &id) {
    auto const &table = IdentifierTable();
    auto const  it    = std::find_if(
        table.begin(), table.end(), [&](std::pair<std::string, Paradigm> const &e) {
            return e.first == id;
        });
    if (it == table.end()) {
        throw UnknownParadigm(id);
    }
    return it->second;
}

ParadigmDefinition const &Definition(Paradigm const p) {
    switch (p) {
    case Paradigm::ArchiStandard: return ArchiStandardDefinition();
    case Paradigm::ArchiSocial: return ArchiSocialDefinition();
    case Paradigm::ArchiSpatial: return ArchiSpatialDefinition();
    case Paradigm::ArchiEmotional: return ArchiEmotionalDefinition();
    case Paradigm::HcpEmotion: return HcpEmotionDefinition();
    case Paradigm::HcpGambling: return HcpGamblingDefinition();
    case Paradigm::HcpLanguage: return HcpLanguageDefinition();
    case Paradigm::HcpMotor: return HcpMotorDefinition();
    case Paradigm::HcpWm: return HcpWmDefinition();
    case Paradigm::HcpRelational: return HcpRelationalDefinition();
    case Paradigm::HcpSocial: return HcpSocialDefinition();
    case Paradigm::RsvpLanguage: return RsvpLanguageDefinition();
    case Paradigm::Colour: return ColourDefinition();
    case Paradigm::Wedge: return WedgeDefinition();
    case Paradigm::Ring: return RingDefinition();
    case Paradigm::PreferencePainting: return PreferenceDefinition("painting");
    case Paradigm::PreferenceHouse: return PreferenceDefinition("house");
    case Paradigm::PreferenceFace: return PreferenceDefinition("face");
    case Paradigm::PreferenceFood: return PreferenceDefinition("food");
    case Paradigm::MttWestEast: return MttDefinition("we");
    case Paradigm::MttSouthNorth: return MttDefinition("sn");
    case Paradigm::EmotionalPain: return EmotionalPainDefinition();
    case Paradigm::PainMovie: return PainMovieDefinition();
    case Paradigm::TheoryOfMind: return TheoryOfMindDefinition();
    case Paradigm::Vstm: return VstmDefinition();
    case Paradigm::Enumeration: return EnumerationDefinition();
    case Paradigm::ClipsTraining: return ClipsTrainingDefinition();
    case Paradigm::SelfLocalizer: return SelfLocalizerDefinition();
    case Paradigm::LyonMoto: return LyonMotoDefinition();
    case Paradigm::LyonMcse: return LyonMcseDefinition();
    case Paradigm::LyonMveb: return LyonMvebDefinition();
    case Paradigm::LyonMvis: return LyonMvisDefinition();
    case Paradigm::LyonLec1: return LyonLec1Definition();
    case Paradigm::LyonLec2: return LyonLec2Definition();
    case Paradigm::LyonAudi: return LyonAudiDefinition();
    case Paradigm::LyonVisu: return LyonVisuDefinition();
    case Paradigm::Audio: return AudioDefinition();
    case Paradigm::Bang: return BangDefinition();
    case Paradigm::SelectiveStopSignal: return SelectiveStopSignalDefinition();
    case Paradigm::StopSignal: return StopSignalDefinition();
    case Paradigm::Stroop: return StroopDefinition();
    case Paradigm::Discount: return DiscountDefinition();
    case Paradigm::Attention: return AttentionDefinition();
    case Paradigm::WardAndAllport: return WardAndAllportDefinition();
    case Paradigm::TwoByTwo: return TwoByTwoDefinition();
    case Paradigm::ColumbiaCards: return ColumbiaCardsDefinition();
    case Paradigm::DotPatterns: return DotPatternsDefinition();
    case Paradigm::BiologicalMotion1: return BiologicalMotion1Definition();
    case Paradigm::BiologicalMotion2: return BiologicalMotion2Definition();
    case Paradigm::MathLanguage: return MathLanguageDefinition();
    case Paradigm::SpatialNavigation: return SpatialNavigationDefinition();
    }
    throw std::invalid_argument("Paradigm enumerator out of range");
}

std::vector<std::string> Identifiers(Paradigm const p) {
    std::vector<std::string> ids;
    for (auto const &entry : IdentifierTable()) {
        if (entry.second == p) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

std::vector<std::string> ListParadigms() {
    std::vector<std::string> ids;
    for (auto const &entry : IdentifierTable()) {
        ids.push_back(entry.first);
    }
    return ids;
}

ContrastMap Evaluate(ParadigmDefinition const &def, Columns const &columns) {
    Elementary const con(columns, def.fold_case);
    ContrastMap      contrasts = def.compute(con);

    std::set<std::string> const declared(def.names.begin(), def.names.end());
    std::vector<std::string>    missing, extra;
    for (auto const &name : declared) {
        if (!contrasts.count(name)) {
            missing.push_back(name);
        }
    }
    for (auto const &kv : contrasts) {
        if (!declared.count(kv.first)) {
            extra.push_back(kv.first);
        }
    }
    if (!missing.empty() || !extra.empty()) {
        IBC_THROW(ContrastMismatch,
                  "Contrasts for {} do not match the declared names. Missing: [{}] Extra: [{}]",
                  def.id,
                  fmt::join(missing, ", "),
                  fmt::join(extra, ", "));
    }
    if (def.extend) {
        AppendDerivatives(columns, contrasts);
        AppendEffectsOfInterest(columns, contrasts);
    }
    return contrasts;
}

ContrastMap Schema(ParadigmDefinition const &def) {
    ContrastMap schema;
    for (auto const &name : def.names) {
        schema[name] = Contrast();
    }
    return schema;
}

ContrastMap MakeContrasts(std::string const &id, Columns const &columns) {
    return Evaluate(Definition(ParseParadigm(id)), columns);
}

ContrastMap ContrastSchema(std::string const &id) {
    return Schema(Definition(ParseParadigm(id)));
}

} // End namespace IBC
