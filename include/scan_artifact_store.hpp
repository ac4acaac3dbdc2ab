#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "time_utils.hpp"

namespace aegis {

struct ChatTurn {
    std::string role;      // "user" or "assistant"
    std::string content;
};

struct ModelMeta {
    std::string model;
    int tokens{0};
};

struct ScanArtifact {
    std::string timestamp;            // ISO-8601 UTC, creation time
    std::string detection_context;
    std::string sitrep;
    ModelMeta meta;
    std::vector<ChatTurn> chat_history;
};

// Scan id -> artifact, persisted as one JSON document. Every
// read-modify-write holds the store mutex for its whole duration and replaces
// the file through a rename, so concurrent chat appends never lose a turn.
class ScanArtifactStore {
public:
    explicit ScanArtifactStore(const std::string& path);

    // False if the id already exists (the original is kept) or the write failed.
    bool create(const std::string& scan_id,
                const std::string& detection_context,
                const std::string& sitrep,
                const ModelMeta& meta);
    bool create(const std::string& scan_id,
                const std::string& detection_context,
                const std::string& sitrep,
                const ModelMeta& meta,
                Clock::time_point created_at);

    std::optional<ScanArtifact> get(const std::string& scan_id) const;

    // Unknown ids are logged and ignored.
    void append_chat_turn(const std::string& scan_id, const std::string& role, const std::string& content);

    // Appends the user question and the assistant answer as one write, so
    // concurrent chats on a scan keep their turns paired. False for an unknown
    // id or a failed write.
    bool append_chat_exchange(const std::string& scan_id, const std::string& question, const std::string& answer);

    std::vector<ChatTurn> chat_history(const std::string& scan_id) const;

    // Keeps the n newest artifacts by creation time. Returns how many were evicted.
    size_t retain_latest(size_t n);

    size_t size() const;

    const std::string& path() const { return path_; }

private:
    nlohmann::json read_locked() const;
    bool write_locked(const nlohmann::json& doc);
    bool append_turns_locked(const std::string& scan_id, const std::vector<ChatTurn>& turns);

    std::string path_;
    mutable std::mutex mu_;
};

nlohmann::json to_json(const ScanArtifact& artifact);
ScanArtifact artifact_from_json(const nlohmann::json& j);

}  // namespace aegis
