#pragma once

#include <string>
#include <unordered_set>

namespace aegis {

// Which class vocabulary the deployed detector speaks. Chosen by configuration,
// never by inspecting the model.
enum class ModelProfile { AUTO, MILITARY, DOTA, COCO };

struct RiskVocabulary {
    std::unordered_set<std::string> high;
    std::unordered_set<std::string> medium;
};

ModelProfile parse_model_profile(const std::string& name);
std::string model_profile_to_string(ModelProfile profile);

// AUTO shares the COCO vocabulary.
RiskVocabulary vocabulary_for(ModelProfile profile);

// Picks the ONNX weights for a profile under models_dir. AUTO takes the first
// existing file of military, dota, coco; a missing custom model falls back to
// coco with a warning.
std::string resolve_weights(ModelProfile profile, const std::string& models_dir);

}  // namespace aegis
