#include "event_log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace aegis {

namespace {

const size_t kColumnCount = 13;

std::string errno_text() {
    return std::strerror(errno);
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// Splits CSV text into records, honouring quoted fields with embedded
// separators, quotes and newlines.
std::vector<std::vector<std::string>> split_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    bool any = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"') {
            quoted = true;
            any = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
            any = true;
        } else if (c == '\n') {
            if (any || !field.empty()) {
                fields.push_back(std::move(field));
                records.push_back(std::move(fields));
            }
            fields.clear();
            field.clear();
            any = false;
        } else if (c != '\r') {
            field.push_back(c);
            any = true;
        }
    }
    if (any || !field.empty()) {
        fields.push_back(std::move(field));
        records.push_back(std::move(fields));
    }
    return records;
}

std::optional<EventLogRow> row_from_fields(const std::vector<std::string>& f) {
    if (f.size() != kColumnCount) return std::nullopt;
    try {
        EventLogRow r;
        r.timestamp = f[0];
        r.image_id = f[1];
        r.threat_level = f[2];
        r.total_detections = std::stoi(f[3]);
        r.high_risk_count = std::stoi(f[4]);
        r.class_name = f[5];
        r.confidence = std::stod(f[6]);
        r.risk_level = f[7];
        r.x1 = std::stoi(f[8]);
        r.y1 = std::stoi(f[9]);
        r.x2 = std::stoi(f[10]);
        r.y2 = std::stoi(f[11]);
        r.inference_ms = std::stod(f[12]);
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

const std::string& event_log_header() {
    static const std::string header =
        "timestamp,image_filename,threat_level,total_detections,high_risk_count,"
        "class_name,confidence,risk_level,box_x1,box_y1,box_x2,box_y2,inference_ms";
    return header;
}

std::vector<EventLogRow> build_rows(const std::string& image_id,
                                    const ThreatReport& report,
                                    const std::vector<Detection>& detections,
                                    double inference_ms,
                                    Clock::time_point at) {
    const std::string ts = log_timestamp(at);
    const std::string level = threat_level_to_string(report.level);

    std::vector<EventLogRow> rows;
    if (detections.empty()) {
        EventLogRow r;
        r.timestamp = ts;
        r.image_id = image_id;
        r.threat_level = level;
        r.class_name = EventLogRow::kSentinelClass;
        r.risk_level = "none";
        r.inference_ms = inference_ms;
        rows.push_back(std::move(r));
        return rows;
    }

    rows.reserve(detections.size());
    for (const auto& d : detections) {
        EventLogRow r;
        r.timestamp = ts;
        r.image_id = image_id;
        r.threat_level = level;
        r.total_detections = report.stats.total;
        r.high_risk_count = report.stats.high_risk;
        r.class_name = d.class_name;
        r.confidence = d.confidence;
        r.risk_level = risk_tier_to_string(d.risk);
        r.x1 = d.box.x1;
        r.y1 = d.box.y1;
        r.x2 = d.box.x2;
        r.y2 = d.box.y2;
        r.inference_ms = inference_ms;
        rows.push_back(std::move(r));
    }
    return rows;
}

std::string format_csv_row(const EventLogRow& r) {
    char conf[32];
    std::snprintf(conf, sizeof(conf), "%.4f", r.confidence);
    char ms[32];
    std::snprintf(ms, sizeof(ms), "%.1f", r.inference_ms);

    std::ostringstream oss;
    oss << csv_escape(r.timestamp) << ','
        << csv_escape(r.image_id) << ','
        << csv_escape(r.threat_level) << ','
        << r.total_detections << ','
        << r.high_risk_count << ','
        << csv_escape(r.class_name) << ','
        << conf << ','
        << csv_escape(r.risk_level) << ','
        << r.x1 << ',' << r.y1 << ',' << r.x2 << ',' << r.y2 << ','
        << ms << '\n';
    return oss.str();
}

EventLog::EventLog(const std::string& path) : path_(path) {}

void EventLog::ensure_header_locked() {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) throw EventLogError("cannot create log directory " + parent.string() + ": " + ec.message());
    }

    const bool exists = std::filesystem::exists(path_, ec);
    if (ec) throw EventLogError("cannot stat event log " + path_ + ": " + ec.message());
    if (exists) {
        const auto size = std::filesystem::file_size(path_, ec);
        if (ec) throw EventLogError("cannot stat event log " + path_ + ": " + ec.message());
        if (size > 0) return;
    }

    std::ofstream f(path_, std::ios::out | std::ios::trunc);
    if (!f) throw EventLogError("cannot create event log " + path_);
    f << event_log_header() << '\n';
    f.flush();
    if (!f) throw EventLogError("cannot write event log header to " + path_);
}

size_t EventLog::append(const std::string& image_id,
                        const ThreatReport& report,
                        const std::vector<Detection>& detections,
                        double inference_ms) {
    return append(image_id, report, detections, inference_ms, Clock::now());
}

size_t EventLog::append(const std::string& image_id,
                        const ThreatReport& report,
                        const std::vector<Detection>& detections,
                        double inference_ms,
                        Clock::time_point at) {
    const auto rows = build_rows(image_id, report, detections, inference_ms, at);
    std::string payload;
    for (const auto& r : rows) payload += format_csv_row(r);

    std::lock_guard<std::mutex> lock(mu_);
    ensure_header_locked();

    int fd = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CLOEXEC);
    if (fd < 0) throw EventLogError("cannot open event log " + path_ + ": " + errno_text());

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const std::string err = errno_text();
        ::close(fd);
        throw EventLogError("cannot stat event log " + path_ + ": " + err);
    }
    const off_t before = st.st_size;

    // A writer that died mid-row leaves the file without a trailing newline.
    // Start on a fresh line so this batch is not glued onto the fragment.
    if (before > 0) {
        char last = '\n';
        if (::pread(fd, &last, 1, before - 1) != 1) {
            const std::string err = errno_text();
            ::close(fd);
            throw EventLogError("cannot read tail of event log " + path_ + ": " + err);
        }
        if (last != '\n') {
            std::cerr << "[WARN] Event log " << path_ << " ends with a partial row" << std::endl;
            payload.insert(payload.begin(), '\n');
        }
    }

    if (!write_all(fd, payload) || ::fdatasync(fd) != 0) {
        const std::string err = errno_text();
        // Roll back whatever part of the batch made it to disk.
        if (::ftruncate(fd, before) != 0) {
            std::cerr << "[ERROR] Event log rollback failed for " << path_ << ": " << errno_text() << std::endl;
        }
        ::close(fd);
        throw EventLogError("event log append failed for " + path_ + ": " + err);
    }
    ::close(fd);

    std::cout << "[INFO] Logged " << rows.size() << " detection row(s) for " << image_id << std::endl;
    return rows.size();
}

std::vector<EventLogRow> EventLog::read_all_locked() const {
    std::vector<EventLogRow> rows;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return rows;

    std::ifstream f(path_, std::ios::in | std::ios::binary);
    if (!f) throw EventLogError("cannot read event log " + path_);
    std::ostringstream buf;
    buf << f.rdbuf();
    if (f.bad()) throw EventLogError("error while reading event log " + path_);

    auto records = split_csv(buf.str());
    size_t skipped = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        if (i == 0 && !records[i].empty() && records[i][0] == "timestamp") continue;
        auto row = row_from_fields(records[i]);
        if (!row) {
            skipped++;
            continue;
        }
        rows.push_back(std::move(*row));
    }
    if (skipped > 0) {
        std::cerr << "[WARN] Skipped " << skipped << " malformed row(s) in " << path_ << std::endl;
    }
    return rows;
}

std::vector<EventLogRow> EventLog::read_all() const {
    std::lock_guard<std::mutex> lock(mu_);
    return read_all_locked();
}

std::vector<EventLogRow> EventLog::read_recent(size_t limit) const {
    auto rows = read_all();
    if (rows.size() > limit) {
        rows.erase(rows.begin(), rows.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return rows;
}

size_t EventLog::compact(Clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto rows = read_all_locked();

    std::string kept = event_log_header() + "\n";
    size_t removed = 0;
    for (const auto& r : rows) {
        auto ts = parse_log_timestamp(r.timestamp);
        if (!ts || *ts < cutoff) {
            removed++;
            continue;
        }
        kept += format_csv_row(r);
    }
    if (removed == 0) return 0;

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!f) throw EventLogError("cannot create " + tmp);
        f << kept;
        f.flush();
        if (!f) throw EventLogError("cannot write " + tmp);
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        const std::string err = errno_text();
        std::remove(tmp.c_str());
        throw EventLogError("cannot replace " + path_ + ": " + err);
    }
    std::cout << "[INFO] Compacted event log " << path_ << ": removed " << removed
              << " row(s), kept " << (rows.size() - removed) << std::endl;
    return removed;
}

}  // namespace aegis
