#include <gtest/gtest.h>

#include <regex>

#include <opencv2/imgcodecs.hpp>

#include "detection_pipeline.hpp"
#include "fakes.hpp"
#include "json_utils.hpp"
#include "test_support.hpp"

using aegis::Analyst;
using aegis::DetectionPipeline;
using aegis::EventLog;
using aegis::InputError;
using aegis::ModelProfile;
using aegis::RawDetections;
using aegis::ScanArtifactStore;
using aegis::ScanRequest;
using aegis::ThreatLevel;
using aegis::testing::FakeDetector;
using aegis::testing::FakeGeocoder;
using aegis::testing::FakeLlm;
using aegis::testing::TempDir;

namespace {

std::string png_bytes(int w = 320, int h = 240) {
    cv::Mat img(h, w, CV_8UC3, cv::Scalar(30, 60, 90));
    std::vector<uchar> buf;
    cv::imencode(".png", img, buf);
    return std::string(buf.begin(), buf.end());
}

RawDetections two_tanks_raw() {
    RawDetections raw;
    raw.class_names = {{0, "tank"}, {1, "military_truck"}};
    aegis::RawInstance a;
    a.x1 = 10;
    a.y1 = 20;
    a.x2 = 90;
    a.y2 = 80;
    a.confidence = 0.9f;
    a.class_id = 0;
    aegis::RawInstance b = a;
    b.x1 = 150;
    b.x2 = 250;
    b.confidence = 0.95f;
    raw.instances = {a, b};
    return raw;
}

struct Harness {
    explicit Harness(RawDetections raw, bool with_llm = true)
        : detector(std::move(raw)),
          log(dir.file("logs/detections.csv")),
          store(dir.file("logs/sitreps.json")),
          analyst(with_llm ? &llm : nullptr, "analyst disabled"),
          pipeline(detector, aegis::vocabulary_for(ModelProfile::MILITARY), log, store, analyst, &geocoder,
                   dir.file("uploads")) {}

    TempDir dir;
    FakeDetector detector;
    FakeLlm llm;
    FakeGeocoder geocoder;
    EventLog log;
    ScanArtifactStore store;
    Analyst analyst;
    DetectionPipeline pipeline;
};

size_t files_in(const std::string& dir) {
    size_t n = 0;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir, ec); !ec && it != std::filesystem::directory_iterator();
         ++it) {
        n++;
    }
    return n;
}

}  // namespace

TEST(UploadNames, AllowedExtensions) {
    EXPECT_TRUE(aegis::allowed_extension("a.PNG"));
    EXPECT_TRUE(aegis::allowed_extension("x.y.tiff"));
    EXPECT_TRUE(aegis::allowed_extension("photo.webp"));
    EXPECT_FALSE(aegis::allowed_extension("a.exe"));
    EXPECT_FALSE(aegis::allowed_extension("noext"));
    EXPECT_FALSE(aegis::allowed_extension("a.tif"));
}

TEST(UploadNames, SanitizesAndPrefixes) {
    EXPECT_EQ(aegis::sanitize_filename("../../etc/pass wd.jpg"), "pass_wd.jpg");
    EXPECT_EQ(aegis::sanitize_filename(".hidden.png"), "hidden.png");

    const auto name = aegis::unique_filename("My Photo (1).JPG");
    EXPECT_TRUE(std::regex_match(name, std::regex("[0-9a-f]{8}_My_Photo__1_\\.JPG"))) << name;
    EXPECT_EQ(aegis::scan_id_from(name), name.substr(0, 8));
}

TEST(UploadNames, LongStemsAreTruncated) {
    const auto name = aegis::unique_filename(std::string(100, 'a') + ".png");
    EXPECT_EQ(name.size(), 8u + 1u + 40u + 4u);
}

TEST(DetectionPipeline, FullScanLogsAndStores) {
    Harness h(two_tanks_raw());
    ScanRequest req{"field.png", png_bytes(), std::nullopt, std::nullopt};
    auto result = h.pipeline.process(req);

    EXPECT_EQ(result.width, 320);
    EXPECT_EQ(result.height, 240);
    ASSERT_EQ(result.detections.size(), 2u);
    EXPECT_FLOAT_EQ(result.detections[0].confidence, 0.95f);
    EXPECT_EQ(result.threat.level, ThreatLevel::CRITICAL);
    EXPECT_TRUE(result.audit_logged);
    EXPECT_TRUE(std::filesystem::exists(result.original_path));
    EXPECT_TRUE(std::filesystem::exists(result.annotated_path));
    EXPECT_EQ(std::filesystem::path(result.annotated_path).filename().string(),
              "annotated_" + std::filesystem::path(result.stored_name).stem().string() + ".jpg");
    EXPECT_EQ(h.detector.last_size, cv::Size(320, 240));

    auto rows = h.log.read_all();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].image_id, result.stored_name);
    EXPECT_EQ(rows[0].threat_level, "CRITICAL");

    ASSERT_TRUE(result.sitrep.success);
    auto artifact = h.store.get(result.scan_id);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->sitrep, "SITREP: two tanks.");
    EXPECT_EQ(artifact->detection_context, result.detection_context);
    EXPECT_FALSE(result.geo.has_value());
}

TEST(DetectionPipeline, EmptySceneWritesSentinel) {
    Harness h(RawDetections{});
    auto result = h.pipeline.process(ScanRequest{"empty.jpg", png_bytes(), std::nullopt, std::nullopt});
    EXPECT_EQ(result.threat.level, ThreatLevel::CLEAR);
    auto rows = h.log.read_all();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(rows[0].is_sentinel());
}

TEST(DetectionPipeline, RejectsBadExtensionBeforeAnySideEffect) {
    Harness h(two_tanks_raw());
    try {
        h.pipeline.process(ScanRequest{"payload.exe", png_bytes(), std::nullopt, std::nullopt});
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(e.kind(), InputError::Kind::UNSUPPORTED_TYPE);
    }
    EXPECT_EQ(h.detector.calls, 0);
    EXPECT_TRUE(h.log.read_all().empty());
    EXPECT_EQ(files_in(h.dir.file("uploads")), 0u);
}

TEST(DetectionPipeline, RejectsUndecodableAndEmptyBodies) {
    Harness h(two_tanks_raw());
    try {
        h.pipeline.process(ScanRequest{"x.png", "definitely not an image", std::nullopt, std::nullopt});
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(e.kind(), InputError::Kind::UNDECODABLE);
    }
    try {
        h.pipeline.process(ScanRequest{"x.png", "", std::nullopt, std::nullopt});
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(e.kind(), InputError::Kind::EMPTY);
    }
    EXPECT_EQ(files_in(h.dir.file("uploads")), 0u);
    EXPECT_TRUE(h.log.read_all().empty());
}

TEST(DetectionPipeline, DetectorFailureWritesNoRow) {
    Harness h(two_tanks_raw());
    h.detector.fail = true;
    EXPECT_THROW(h.pipeline.process(ScanRequest{"a.png", png_bytes(), std::nullopt, std::nullopt}),
                 aegis::DetectorError);
    EXPECT_TRUE(h.log.read_all().empty());
    EXPECT_EQ(h.store.size(), 0u);
}

TEST(DetectionPipeline, LogFailureStillReturnsReport) {
    TempDir dir;
    FakeDetector detector(two_tanks_raw());
    EventLog broken("/proc/aegis-not-writable/d.csv");
    ScanArtifactStore store(dir.file("s.json"));
    Analyst analyst(nullptr, "off");
    DetectionPipeline pipeline(detector, aegis::vocabulary_for(ModelProfile::MILITARY), broken, store, analyst,
                               nullptr, dir.file("uploads"));

    auto result = pipeline.process(ScanRequest{"a.png", png_bytes(), std::nullopt, std::nullopt});
    EXPECT_EQ(result.threat.level, ThreatLevel::CRITICAL);
    EXPECT_FALSE(result.audit_logged);
    EXPECT_FALSE(result.audit_error.empty());
    EXPECT_FALSE(result.sitrep.success);
    EXPECT_EQ(result.sitrep.error, "off");
}

TEST(DetectionPipeline, LlmFailureDoesNotAffectDetection) {
    Harness h(two_tanks_raw());
    h.llm.fail = true;
    auto result = h.pipeline.process(ScanRequest{"a.png", png_bytes(), std::nullopt, std::nullopt});
    EXPECT_TRUE(result.audit_logged);
    EXPECT_FALSE(result.sitrep.success);
    EXPECT_EQ(h.store.size(), 0u);
}

TEST(DetectionPipeline, CoordinatesAreGeocoded) {
    Harness h(RawDetections{});
    auto result = h.pipeline.process(ScanRequest{"a.png", png_bytes(), 50.45, 30.52});
    ASSERT_TRUE(result.geo.has_value());
    EXPECT_EQ(result.geo->location_name, "Kyiv, Ukraine");
    EXPECT_EQ(result.geo->maps_link, "https://www.google.com/maps?q=50.450000,30.520000");
}

TEST(DetectionPipeline, ResultJson) {
    Harness h(two_tanks_raw());
    auto result = h.pipeline.process(ScanRequest{"a.png", png_bytes(), std::nullopt, std::nullopt});
    auto j = aegis::to_json(result, true);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["scan_id"], result.scan_id);
    EXPECT_EQ(j["threat"]["threat_level"], "CRITICAL");
    EXPECT_EQ(j["threat"]["stats"]["high_risk"], 2);
    EXPECT_EQ(j["detections"][0]["risk_level"], "high");
    EXPECT_EQ(j["detections"][0]["confidence"], 0.95);
    EXPECT_EQ(j["detections"][0]["box"]["width"], 100);
    EXPECT_EQ(j["image_size"]["width"], 320);
    EXPECT_TRUE(j["geo"].is_null());
}

TEST(DetectionPipeline, InvalidUtf8ClassNameDoesNotAbortEnrichment) {
    RawDetections raw = two_tanks_raw();
    raw.class_names[0] = "v\xE9hicule";
    Harness h(raw);
    auto result = h.pipeline.process(ScanRequest{"a.png", png_bytes(), std::nullopt, std::nullopt});

    EXPECT_TRUE(result.audit_logged);
    ASSERT_TRUE(result.sitrep.success);
    auto artifact = h.store.get(result.scan_id);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_NE(artifact->detection_context.find("V\xEF\xBF\xBDHICULE"), std::string::npos);
    EXPECT_NO_THROW(aegis::dump_json(aegis::to_json(result, true)));
}
