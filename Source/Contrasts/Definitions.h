/*
 *  Definitions.h
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#ifndef IBC_DEFINITIONS_H
#define IBC_DEFINITIONS_H

#include "Paradigm.h"

namespace IBC {

// ARCHI localizers
ParadigmDefinition const &ArchiStandardDefinition();
ParadigmDefinition const &ArchiSocialDefinition();
ParadigmDefinition const &ArchiSpatialDefinition();
ParadigmDefinition const &ArchiEmotionalDefinition();

// Human Connectome Project protocols
ParadigmDefinition const &HcpEmotionDefinition();
ParadigmDefinition const &HcpGamblingDefinition();
ParadigmDefinition const &HcpLanguageDefinition();
ParadigmDefinition const &HcpMotorDefinition();
ParadigmDefinition const &HcpWmDefinition();
ParadigmDefinition const &HcpRelationalDefinition();
ParadigmDefinition const &HcpSocialDefinition();

// Lyon localizers
ParadigmDefinition const &LyonMotoDefinition();
ParadigmDefinition const &LyonMcseDefinition();
ParadigmDefinition const &LyonMvebDefinition();
ParadigmDefinition const &LyonMvisDefinition();
ParadigmDefinition const &LyonLec1Definition();
ParadigmDefinition const &LyonLec2Definition();
ParadigmDefinition const &LyonAudiDefinition();
ParadigmDefinition const &LyonVisuDefinition();

// Stanford battery
ParadigmDefinition const &SelectiveStopSignalDefinition();
ParadigmDefinition const &StopSignalDefinition();
ParadigmDefinition const &StroopDefinition();
ParadigmDefinition const &DiscountDefinition();
ParadigmDefinition const &AttentionDefinition();
ParadigmDefinition const &WardAndAllportDefinition();
ParadigmDefinition const &TwoByTwoDefinition();
ParadigmDefinition const &ColumbiaCardsDefinition();
ParadigmDefinition const &DotPatternsDefinition();

// Retinotopy, preference, numerosity and spatio-temporal tasks
ParadigmDefinition const &WedgeDefinition();
ParadigmDefinition const &RingDefinition();
ParadigmDefinition const &PreferenceDefinition(std::string const &domain);
ParadigmDefinition const &MttDefinition(std::string const &axis);
ParadigmDefinition const &VstmDefinition();
ParadigmDefinition const &EnumerationDefinition();

// Language, social cognition and the remaining localizers
ParadigmDefinition const &RsvpLanguageDefinition();
ParadigmDefinition const &ColourDefinition();
ParadigmDefinition const &EmotionalPainDefinition();
ParadigmDefinition const &PainMovieDefinition();
ParadigmDefinition const &TheoryOfMindDefinition();
ParadigmDefinition const &ClipsTrainingDefinition();
ParadigmDefinition const &SelfLocalizerDefinition();
ParadigmDefinition const &AudioDefinition();
ParadigmDefinition const &BangDefinition();
ParadigmDefinition const &BiologicalMotion1Definition();
ParadigmDefinition const &BiologicalMotion2Definition();
ParadigmDefinition const &MathLanguageDefinition();
ParadigmDefinition const &SpatialNavigationDefinition();

} // End namespace IBC

#endif // IBC_DEFINITIONS_H
