#pragma once

#include <array>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "detection_types.hpp"
#include "event_log.hpp"
#include "model_profile.hpp"
#include "time_utils.hpp"

namespace aegis {

struct DashboardSummary {
    int total_scans{0};
    int total_detections{0};
    int critical_today{0};
    std::string most_detected_class{"None"};
};

struct DailyCount {
    std::string date;
    int count{0};
};

struct ClassCount {
    std::string class_name;
    int count{0};
    RiskTier risk{RiskTier::LOW};
};

struct HistogramBin {
    std::string bin;
    int count{0};
};

struct DashboardSnapshot {
    DashboardSummary summary;
    std::array<int, 5> threat_distribution{};            // indexed by ThreatLevel
    std::vector<DailyCount> detections_over_time;        // 30 days, ascending
    std::vector<ClassCount> top_classes;                 // at most 10
    std::array<std::array<int, 24>, 7> hourly_heatmap{}; // [Mon..Sun][hour]
    std::vector<HistogramBin> confidence_histogram;      // 10 bins
    std::vector<EventLogRow> recent_rows;                // newest first, at most 25

    int threat_count(ThreatLevel level) const { return threat_distribution[static_cast<size_t>(level)]; }
};

const char* weekday_abbrev(int weekday);

class AnalyticsEngine {
public:
    static constexpr int kSeriesDays = 30;
    static constexpr size_t kTopClasses = 10;
    static constexpr size_t kRecentRows = 25;
    static constexpr int kConfidenceBins = 10;

    explicit AnalyticsEngine(RiskVocabulary vocabulary);

    // Never throws: a missing or unreadable log yields empty_snapshot(now).
    DashboardSnapshot compute(const EventLog& log, Clock::time_point now) const;
    DashboardSnapshot compute(const EventLog& log) const;

    DashboardSnapshot compute_rows(const std::vector<EventLogRow>& rows, Clock::time_point now) const;

    static DashboardSnapshot empty_snapshot(Clock::time_point now);

private:
    RiskVocabulary vocabulary_;
};

nlohmann::json row_to_json(const EventLogRow& row);
nlohmann::json to_json(const DashboardSnapshot& snapshot);

}  // namespace aegis
