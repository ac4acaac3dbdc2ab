#pragma once

#include <string>

#include "detection_types.hpp"
#include "model_profile.hpp"

namespace aegis {

// Lower-cases and replaces spaces with underscores.
std::string canonical_class_name(const std::string& name);

RiskTier classify(const std::string& class_name, const RiskVocabulary& vocabulary);

}  // namespace aegis
