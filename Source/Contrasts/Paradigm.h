/*
 *  Paradigm.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_PARADIGM_H
#define IBC_PARADIGM_H

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "Elementary.h"

namespace IBC {

enum class Paradigm {
    ArchiStandard,
    ArchiSocial,
    ArchiSpatial,
    ArchiEmotional,
    HcpEmotion,
    HcpGambling,
    HcpLanguage,
    HcpMotor,
    HcpWm,
    HcpRelational,
    HcpSocial,
    RsvpLanguage,
    Colour,
    Wedge,
    Ring,
    PreferencePainting,
    PreferenceHouse,
    PreferenceFace,
    PreferenceFood,
    MttWestEast,
    MttSouthNorth,
    EmotionalPain,
    PainMovie,
    TheoryOfMind,
    Vstm,
    Enumeration,
    ClipsTraining,
    SelfLocalizer,
    LyonMoto,
    LyonMcse,
    LyonMveb,
    LyonMvis,
    LyonLec1,
    LyonLec2,
    LyonAudi,
    LyonVisu,
    Audio,
    Bang,
    SelectiveStopSignal,
    StopSignal,
    Stroop,
    Discount,
    Attention,
    WardAndAllport,
    TwoByTwo,
    ColumbiaCards,
    DotPatterns,
    BiologicalMotion1,
    BiologicalMotion2,
    MathLanguage,
    SpatialNavigation
};

/*
 * Everything needed to build the contrasts of one paradigm.
 * `names` is the declared vocabulary, `compute` must produce exactly these names.
 * `regressors` lists the first-level conditions the contrasts are built from.
 */
struct ParadigmDefinition {
    std::string                                   id;
    std::vector<std::string>                      names;
    std::vector<std::string>                      regressors;
    std::function<ContrastMap(Elementary const &)> compute;
    bool                                          fold_case = false;
    bool                                          extend    = true;
};

std::vector<std::pair<std::string, Paradigm>> const &IdentifierTable();
std::vector<Paradigm> const &                        AllParadigms();

Paradigm                  ParseParadigm(std::string const &id); //!< Throws UnknownParadigm
ParadigmDefinition const &Definition(Paradigm const p);
std::vector<std::string>  Identifiers(Paradigm const p); //!< Every identifier that routes to p
std::vector<std::string>  ListParadigms();                //!< Every accepted identifier

ContrastMap Evaluate(ParadigmDefinition const &def, Columns const &columns);
ContrastMap Schema(ParadigmDefinition const &def);

ContrastMap MakeContrasts(std::string const &id, Columns const &columns);
ContrastMap ContrastSchema(std::string const &id);

} // End namespace IBC

#endif // IBC_PARADIGM_H
