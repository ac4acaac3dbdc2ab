#include "analytics_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "risk_classifier.hpp"

namespace aegis {

namespace {

const char* kWeekdays[7] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

struct TimedRow {
    const EventLogRow* row;
    Clock::time_point at;
    std::tm tm;
};

std::string bin_label(int i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f-%.1f", i / 10.0, (i + 1) / 10.0);
    return buf;
}

// Bins are right-closed, (0.1, 0.2] and so on; the first one also takes 0.0.
// Works on ten-thousandths so 0.3000 lands in 0.2-0.3 exactly.
int confidence_bin(double confidence) {
    const long units = std::lround(confidence * 10000.0);
    if (units <= 0) return 0;
    return std::min(static_cast<int>((units - 1) / 1000), AnalyticsEngine::kConfidenceBins - 1);
}

// Counts keyed by first appearance so equal counts keep log order.
class OrderedCounter {
public:
    void add(const std::string& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, entries_.size());
            entries_.emplace_back(key, 1);
        } else {
            entries_[it->second].second++;
        }
    }

    std::vector<std::pair<std::string, int>> ranked() const {
        auto out = entries_;
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        return out;
    }

private:
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::pair<std::string, int>> entries_;
};

}  // namespace

const char* weekday_abbrev(int weekday) {
    if (weekday < 0 || weekday > 6) return "";
    return kWeekdays[weekday];
}

AnalyticsEngine::AnalyticsEngine(RiskVocabulary vocabulary) : vocabulary_(std::move(vocabulary)) {}

DashboardSnapshot AnalyticsEngine::empty_snapshot(Clock::time_point now) {
    DashboardSnapshot s;
    s.detections_over_time.reserve(kSeriesDays);
    for (int i = kSeriesDays - 1; i >= 0; --i) {
        s.detections_over_time.push_back(DailyCount{utc_date(now - std::chrono::hours(24 * i)), 0});
    }
    s.confidence_histogram.reserve(kConfidenceBins);
    for (int i = 0; i < kConfidenceBins; ++i) {
        s.confidence_histogram.push_back(HistogramBin{bin_label(i), 0});
    }
    return s;
}

DashboardSnapshot AnalyticsEngine::compute(const EventLog& log) const {
    return compute(log, Clock::now());
}

DashboardSnapshot AnalyticsEngine::compute(const EventLog& log, Clock::time_point now) const {
    std::vector<EventLogRow> rows;
    try {
        rows = log.read_all();
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Analytics could not read " << log.path() << ": " << e.what() << std::endl;
        return empty_snapshot(now);
    }
    return compute_rows(rows, now);
}

DashboardSnapshot AnalyticsEngine::compute_rows(const std::vector<EventLogRow>& rows, Clock::time_point now) const {
    std::vector<TimedRow> timed;
    timed.reserve(rows.size());
    for (const auto& r : rows) {
        auto at = parse_log_timestamp(r.timestamp);
        if (!at) continue;
        timed.push_back(TimedRow{&r, *at, to_utc_tm(*at)});
    }

    DashboardSnapshot s = empty_snapshot(now);
    if (timed.empty()) return s;

    const std::string today = utc_date(now);

    std::unordered_set<std::string> images;
    std::unordered_set<std::string> critical_today;
    std::unordered_map<std::string, ThreatLevel> first_level;
    std::vector<ThreatLevel> first_level_order;
    std::map<std::string, int> per_day;
    OrderedCounter classes;

    for (const auto& t : timed) {
        const EventLogRow& r = *t.row;
        const std::string date = utc_date(t.at);

        images.insert(r.image_id);
        if (r.threat_level == "CRITICAL" && date == today) critical_today.insert(r.image_id);

        if (!first_level.count(r.image_id)) {
            auto level = threat_level_from_string(r.threat_level);
            if (level) {
                first_level.emplace(r.image_id, *level);
                first_level_order.push_back(*level);
            }
        }

        if (r.is_sentinel()) continue;

        s.summary.total_detections++;
        classes.add(r.class_name);
        per_day[date]++;
        s.hourly_heatmap[weekday_index(t.tm)][t.tm.tm_hour]++;
        if (r.confidence >= 0.0 && r.confidence <= 1.0) {
            s.confidence_histogram[confidence_bin(r.confidence)].count++;
        }
    }

    s.summary.total_scans = static_cast<int>(images.size());
    s.summary.critical_today = static_cast<int>(critical_today.size());

    for (ThreatLevel level : first_level_order) {
        s.threat_distribution[static_cast<size_t>(level)]++;
    }

    for (auto& point : s.detections_over_time) {
        auto it = per_day.find(point.date);
        if (it != per_day.end()) point.count = it->second;
    }

    const auto ranked = classes.ranked();
    if (!ranked.empty()) s.summary.most_detected_class = ranked.front().first;
    for (size_t i = 0; i < ranked.size() && i < kTopClasses; ++i) {
        s.top_classes.push_back(ClassCount{ranked[i].first, ranked[i].second, classify(ranked[i].first, vocabulary_)});
    }

    const size_t start = timed.size() > kRecentRows ? timed.size() - kRecentRows : 0;
    std::vector<TimedRow> recent(timed.begin() + static_cast<std::ptrdiff_t>(start), timed.end());
    std::stable_sort(recent.begin(), recent.end(),
                     [](const TimedRow& a, const TimedRow& b) { return a.at > b.at; });
    s.recent_rows.reserve(recent.size());
    for (const auto& t : recent) s.recent_rows.push_back(*t.row);

    return s;
}

nlohmann::json row_to_json(const EventLogRow& r) {
    char conf[32];
    std::snprintf(conf, sizeof(conf), "%.4f", r.confidence);
    return nlohmann::json{
        {"timestamp", r.timestamp},
        {"image_filename", r.image_id},
        {"threat_level", r.threat_level},
        {"total_detections", r.total_detections},
        {"high_risk_count", r.high_risk_count},
        {"class_name", r.class_name},
        {"confidence", conf},
        {"risk_level", r.risk_level},
        {"box_x1", r.x1},
        {"box_y1", r.y1},
        {"box_x2", r.x2},
        {"box_y2", r.y2},
        {"inference_ms", r.inference_ms},
    };
}

nlohmann::json to_json(const DashboardSnapshot& s) {
    nlohmann::json j;
    j["summary"] = {
        {"total_scans", s.summary.total_scans},
        {"total_detections", s.summary.total_detections},
        {"critical_today", s.summary.critical_today},
        {"most_detected_class", s.summary.most_detected_class},
    };

    nlohmann::json dist = nlohmann::json::object();
    for (ThreatLevel level : {ThreatLevel::CRITICAL, ThreatLevel::HIGH, ThreatLevel::ELEVATED,
                              ThreatLevel::LOW, ThreatLevel::CLEAR}) {
        dist[threat_level_to_string(level)] = s.threat_count(level);
    }
    j["threat_distribution"] = dist;

    j["detections_over_time"] = nlohmann::json::array();
    for (const auto& p : s.detections_over_time) {
        j["detections_over_time"].push_back({{"date", p.date}, {"count", p.count}});
    }

    j["top_classes"] = nlohmann::json::array();
    for (const auto& c : s.top_classes) {
        j["top_classes"].push_back({{"class_name", c.class_name}, {"count", c.count},
                                    {"risk", risk_tier_to_string(c.risk)}});
    }

    nlohmann::json heat = nlohmann::json::object();
    for (int d = 0; d < 7; ++d) {
        nlohmann::json hours = nlohmann::json::object();
        for (int h = 0; h < 24; ++h) hours[std::to_string(h)] = s.hourly_heatmap[d][h];
        heat[weekday_abbrev(d)] = hours;
    }
    j["hourly_heatmap"] = heat;

    j["confidence_histogram"] = nlohmann::json::array();
    for (const auto& b : s.confidence_histogram) {
        j["confidence_histogram"].push_back({{"bin", b.bin}, {"count", b.count}});
    }

    j["recent_rows"] = nlohmann::json::array();
    for (const auto& r : s.recent_rows) j["recent_rows"].push_back(row_to_json(r));
    return j;
}

}  // namespace aegis
