#include "model_profile.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace aegis {

namespace {

const char* kMilitaryWeights = "best_model.onnx";
const char* kDotaWeights = "dota_model.onnx";
const char* kCocoWeights = "yolo11n.onnx";

std::string join_path(const std::string& dir, const char* file) {
    return (std::filesystem::path(dir) / file).string();
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

}  // namespace

ModelProfile parse_model_profile(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "military") return ModelProfile::MILITARY;
    if (lower == "dota") return ModelProfile::DOTA;
    if (lower == "coco") return ModelProfile::COCO;
    return ModelProfile::AUTO;
}

std::string model_profile_to_string(ModelProfile profile) {
    switch (profile) {
        case ModelProfile::MILITARY: return "military";
        case ModelProfile::DOTA: return "dota";
        case ModelProfile::COCO: return "coco";
        default: return "auto";
    }
}

RiskVocabulary vocabulary_for(ModelProfile profile) {
    RiskVocabulary v;
    switch (profile) {
        case ModelProfile::MILITARY:
            v.high = {"tank", "armored_vehicle", "missile_launcher", "artillery",
                      "rocket_launcher", "anti_aircraft_gun",
                      "fighter_jet", "attack_helicopter", "combat_drone",
                      "warship", "submarine"};
            v.medium = {"military_truck", "patrol_boat", "military_helicopter",
                        "radar_station", "bunker", "recon_drone",
                        "military_personnel", "runway", "helipad"};
            break;
        case ModelProfile::DOTA:
            // Aerial imagery
            v.high = {"plane", "helicopter", "ship", "harbor", "large-vehicle", "bridge"};
            v.medium = {"small-vehicle", "storage-tank", "ground-track-field",
                        "baseball-diamond", "tennis-court", "basketball-court",
                        "soccer-ball-field", "swimming-pool", "roundabout"};
            break;
        default:
            v.high = {"truck", "bus", "car", "airplane", "helicopter", "knife", "scissors"};
            v.medium = {"person", "backpack", "handbag", "boat", "train", "bicycle", "motorcycle"};
            break;
    }
    return v;
}

std::string resolve_weights(ModelProfile profile, const std::string& models_dir) {
    const std::string military = join_path(models_dir, kMilitaryWeights);
    const std::string dota = join_path(models_dir, kDotaWeights);
    const std::string coco = join_path(models_dir, kCocoWeights);

    switch (profile) {
        case ModelProfile::MILITARY:
            if (file_exists(military)) return military;
            std::cerr << "[WARN] Military model not found at " << military << "; falling back to COCO" << std::endl;
            return coco;
        case ModelProfile::DOTA:
            if (file_exists(dota)) return dota;
            std::cerr << "[WARN] DOTA model not found at " << dota << "; falling back to COCO" << std::endl;
            return coco;
        case ModelProfile::COCO:
            return coco;
        default:
            if (file_exists(military)) return military;
            if (file_exists(dota)) return dota;
            std::cerr << "[WARN] No custom models found; using COCO weights " << coco << std::endl;
            return coco;
    }
}

}  // namespace aegis
