#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "detection_types.hpp"
#include "time_utils.hpp"

namespace aegis {

class EventLogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EventLogRow {
    std::string timestamp;       // UTC, "YYYY-MM-DD HH:MM:SS"
    std::string image_id;
    std::string threat_level;
    int total_detections{0};
    int high_risk_count{0};
    std::string class_name;
    double confidence{0.0};
    std::string risk_level;
    int x1{0};
    int y1{0};
    int x2{0};
    int y2{0};
    double inference_ms{0.0};

    bool is_sentinel() const { return class_name == kSentinelClass; }

    static constexpr const char* kSentinelClass = "NONE";
};

// Header line of the CSV, without the trailing newline.
const std::string& event_log_header();

// One row per detection, or a single sentinel row when there are none.
std::vector<EventLogRow> build_rows(const std::string& image_id,
                                    const ThreatReport& report,
                                    const std::vector<Detection>& detections,
                                    double inference_ms,
                                    Clock::time_point at);

std::string format_csv_row(const EventLogRow& row);

// Append-only CSV audit trail. Each append lands completely or not at all;
// rows are never rewritten except by the explicit compact() maintenance call.
class EventLog {
public:
    explicit EventLog(const std::string& path);

    // Returns the number of rows written. Throws EventLogError on I/O failure,
    // in which case the file is left as it was before the call.
    size_t append(const std::string& image_id,
                  const ThreatReport& report,
                  const std::vector<Detection>& detections,
                  double inference_ms);
    size_t append(const std::string& image_id,
                  const ThreatReport& report,
                  const std::vector<Detection>& detections,
                  double inference_ms,
                  Clock::time_point at);

    // File order (oldest first). A missing file reads as empty; an unreadable
    // one throws EventLogError.
    std::vector<EventLogRow> read_all() const;

    // The last `limit` rows, oldest first / most recent last.
    std::vector<EventLogRow> read_recent(size_t limit) const;

    // Drops rows older than cutoff. Returns the number of rows removed.
    size_t compact(Clock::time_point cutoff);

    const std::string& path() const { return path_; }

private:
    void ensure_header_locked();
    std::vector<EventLogRow> read_all_locked() const;

    std::string path_;
    mutable std::mutex mu_;
};

}  // namespace aegis
