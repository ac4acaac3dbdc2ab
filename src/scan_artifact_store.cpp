#include "scan_artifact_store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

#include "json_utils.hpp"

namespace aegis {

nlohmann::json to_json(const ScanArtifact& a) {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& t : a.chat_history) {
        history.push_back({{"role", t.role}, {"content", t.content}});
    }
    return nlohmann::json{
        {"timestamp", a.timestamp},
        {"detection_context", a.detection_context},
        {"sitrep", a.sitrep},
        {"model", a.meta.model},
        {"tokens", a.meta.tokens},
        {"chat_history", history},
    };
}

ScanArtifact artifact_from_json(const nlohmann::json& j) {
    ScanArtifact a;
    a.timestamp = j.value("timestamp", "");
    a.detection_context = j.value("detection_context", "");
    a.sitrep = j.value("sitrep", "");
    a.meta.model = j.value("model", "");
    a.meta.tokens = j.value("tokens", 0);
    if (j.contains("chat_history") && j["chat_history"].is_array()) {
        for (const auto& t : j["chat_history"]) {
            a.chat_history.push_back(ChatTurn{t.value("role", ""), t.value("content", "")});
        }
    }
    return a;
}

ScanArtifactStore::ScanArtifactStore(const std::string& path) : path_(path) {
    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (!std::filesystem::exists(path_, ec)) {
        write_locked(nlohmann::json::object());
    }
}

nlohmann::json ScanArtifactStore::read_locked() const {
    std::ifstream f(path_);
    if (!f) {
        std::cerr << "[WARN] Could not open scan store " << path_ << ", treating as empty" << std::endl;
        return nlohmann::json::object();
    }
    try {
        nlohmann::json doc = nlohmann::json::parse(f);
        if (doc.is_object()) return doc;
        std::cerr << "[WARN] Scan store " << path_ << " is not a JSON object, treating as empty" << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WARN] Could not parse scan store " << path_ << ": " << e.what() << std::endl;
    }
    return nlohmann::json::object();
}

bool ScanArtifactStore::write_locked(const nlohmann::json& doc) {
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc);
        if (!f) {
            std::cerr << "[ERROR] Failed to write scan store " << tmp << std::endl;
            return false;
        }
        f << dump_json(doc, 2);
        f.flush();
        if (!f) {
            std::cerr << "[ERROR] Failed to write scan store " << tmp << std::endl;
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::cerr << "[ERROR] Failed to replace scan store " << path_ << std::endl;
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool ScanArtifactStore::create(const std::string& scan_id,
                               const std::string& detection_context,
                               const std::string& sitrep,
                               const ModelMeta& meta) {
    return create(scan_id, detection_context, sitrep, meta, Clock::now());
}

bool ScanArtifactStore::create(const std::string& scan_id,
                               const std::string& detection_context,
                               const std::string& sitrep,
                               const ModelMeta& meta,
                               Clock::time_point created_at) {
    ScanArtifact a;
    a.timestamp = iso_timestamp(created_at);
    a.detection_context = detection_context;
    a.sitrep = sitrep;
    a.meta = meta;

    std::lock_guard<std::mutex> lock(mu_);
    nlohmann::json doc = read_locked();
    if (doc.contains(scan_id)) {
        std::cerr << "[WARN] Scan " << scan_id << " already stored, keeping the original" << std::endl;
        return false;
    }
    doc[scan_id] = to_json(a);
    if (!write_locked(doc)) return false;
    std::cout << "[INFO] Saved SITREP for scan " << scan_id << std::endl;
    return true;
}

std::optional<ScanArtifact> ScanArtifactStore::get(const std::string& scan_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    const nlohmann::json doc = read_locked();
    auto it = doc.find(scan_id);
    if (it == doc.end() || !it->is_object()) return std::nullopt;
    return artifact_from_json(*it);
}

bool ScanArtifactStore::append_turns_locked(const std::string& scan_id, const std::vector<ChatTurn>& turns) {
    nlohmann::json doc = read_locked();
    auto it = doc.find(scan_id);
    if (it == doc.end() || !it->is_object()) {
        std::cerr << "[WARN] Scan " << scan_id << " not found, cannot add chat message" << std::endl;
        return false;
    }
    if (!(*it)["chat_history"].is_array()) (*it)["chat_history"] = nlohmann::json::array();
    for (const auto& t : turns) {
        (*it)["chat_history"].push_back({{"role", t.role}, {"content", t.content}});
    }
    return write_locked(doc);
}

void ScanArtifactStore::append_chat_turn(const std::string& scan_id,
                                         const std::string& role,
                                         const std::string& content) {
    std::lock_guard<std::mutex> lock(mu_);
    append_turns_locked(scan_id, {ChatTurn{role, content}});
}

bool ScanArtifactStore::append_chat_exchange(const std::string& scan_id,
                                             const std::string& question,
                                             const std::string& answer) {
    std::lock_guard<std::mutex> lock(mu_);
    return append_turns_locked(scan_id, {ChatTurn{"user", question}, ChatTurn{"assistant", answer}});
}

std::vector<ChatTurn> ScanArtifactStore::chat_history(const std::string& scan_id) const {
    auto artifact = get(scan_id);
    if (!artifact) return {};
    return artifact->chat_history;
}

size_t ScanArtifactStore::retain_latest(size_t n) {
    std::lock_guard<std::mutex> lock(mu_);
    nlohmann::json doc = read_locked();
    if (doc.size() <= n) return 0;

    std::vector<std::pair<std::string, std::string>> by_time;  // (timestamp, id)
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string ts = it.value().is_object() ? it.value().value("timestamp", "") : std::string();
        by_time.emplace_back(ts, it.key());
    }
    std::stable_sort(by_time.begin(), by_time.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    nlohmann::json kept = nlohmann::json::object();
    for (size_t i = 0; i < n; ++i) {
        kept[by_time[i].second] = doc[by_time[i].second];
    }
    const size_t removed = doc.size() - kept.size();
    if (!write_locked(kept)) return 0;
    std::cout << "[INFO] Cleaned up " << removed << " old scans, kept " << kept.size() << std::endl;
    return removed;
}

size_t ScanArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return read_locked().size();
}

}  // namespace aegis
