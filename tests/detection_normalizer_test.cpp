#include <gtest/gtest.h>

#include <limits>

#include "detection_normalizer.hpp"

using aegis::RawDetections;
using aegis::RawInstance;
using aegis::RiskTier;

namespace {

RawInstance inst(float x1, float y1, float x2, float y2, float conf, int cls) {
    RawInstance r;
    r.x1 = x1;
    r.y1 = y1;
    r.x2 = x2;
    r.y2 = y2;
    r.confidence = conf;
    r.class_id = cls;
    return r;
}

RawDetections military_raw() {
    RawDetections raw;
    raw.class_names = {{0, "tank"}, {1, "military_truck"}, {2, "car"}};
    raw.instances = {
        inst(5.9f, 5.2f, 50.7f, 60.1f, 0.55f, 2),
        inst(100.f, 100.f, 200.f, 180.f, 0.6f, 1),
        inst(10.f, 10.f, 30.f, 30.f, 0.9f, 0),
        inst(40.f, 40.f, 90.f, 90.f, 0.95f, 0),
    };
    return raw;
}

}  // namespace

TEST(DetectionNormalizer, EmptyInputGivesEmptyList) {
    RawDetections raw;
    EXPECT_TRUE(aegis::normalize_detections(raw, aegis::vocabulary_for(aegis::ModelProfile::MILITARY)).empty());
}

TEST(DetectionNormalizer, OrdersByTierThenConfidence) {
    auto dets = aegis::normalize_detections(military_raw(), aegis::vocabulary_for(aegis::ModelProfile::MILITARY));
    ASSERT_EQ(dets.size(), 4u);
    EXPECT_EQ(dets[0].class_name, "tank");
    EXPECT_FLOAT_EQ(dets[0].confidence, 0.95f);
    EXPECT_EQ(dets[0].index, 3);
    EXPECT_EQ(dets[1].class_name, "tank");
    EXPECT_EQ(dets[1].index, 2);
    EXPECT_EQ(dets[2].risk, RiskTier::MEDIUM);
    EXPECT_EQ(dets[3].risk, RiskTier::LOW);
}

TEST(DetectionNormalizer, TruncatesCoordinatesAndDerivesGeometry) {
    auto dets = aegis::normalize_detections(military_raw(), aegis::vocabulary_for(aegis::ModelProfile::MILITARY));
    const auto& car = dets.back();
    EXPECT_EQ(car.box.x1, 5);
    EXPECT_EQ(car.box.y1, 5);
    EXPECT_EQ(car.box.x2, 50);
    EXPECT_EQ(car.box.y2, 60);
    EXPECT_EQ(car.box.width(), 45);
    EXPECT_EQ(car.box.height(), 55);
    EXPECT_EQ(car.box.cx(), 27);
    EXPECT_EQ(car.box.cy(), 32);
}

TEST(DetectionNormalizer, SwapsReversedCornersAndClampsConfidence) {
    RawDetections raw;
    raw.class_names = {{0, "tank"}};
    raw.instances = {inst(80.f, 90.f, 20.f, 10.f, 1.7f, 0), inst(1.f, 1.f, 2.f, 2.f, -0.2f, 0)};
    auto dets = aegis::normalize_detections(raw, aegis::vocabulary_for(aegis::ModelProfile::MILITARY));
    ASSERT_EQ(dets.size(), 2u);
    EXPECT_EQ(dets[0].box.x1, 20);
    EXPECT_EQ(dets[0].box.x2, 80);
    EXPECT_EQ(dets[0].box.y1, 10);
    EXPECT_EQ(dets[0].box.y2, 90);
    EXPECT_FLOAT_EQ(dets[0].confidence, 1.0f);
    EXPECT_FLOAT_EQ(dets[1].confidence, 0.0f);
}

TEST(DetectionNormalizer, RoundsConfidenceToFourDecimals) {
    RawDetections raw;
    raw.class_names = {{0, "car"}};
    raw.instances = {inst(0.f, 0.f, 1.f, 1.f, 0.123456f, 0)};
    auto dets = aegis::normalize_detections(raw, aegis::vocabulary_for(aegis::ModelProfile::COCO));
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_FLOAT_EQ(dets[0].confidence, 0.1235f);
}

TEST(DetectionNormalizer, UnknownClassIndexGetsPlaceholderName) {
    RawDetections raw;
    raw.class_names = {{0, "car"}};
    raw.instances = {inst(0.f, 0.f, 1.f, 1.f, 0.5f, 7)};
    auto dets = aegis::normalize_detections(raw, aegis::vocabulary_for(aegis::ModelProfile::COCO));
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_EQ(dets[0].class_name, "class_7");
    EXPECT_EQ(dets[0].risk, RiskTier::LOW);
}

TEST(DetectionNormalizer, EqualKeysKeepDetectorOrder) {
    RawDetections raw;
    raw.class_names = {{0, "dog"}, {1, "cat"}};
    raw.instances = {inst(0.f, 0.f, 1.f, 1.f, 0.5f, 0), inst(2.f, 2.f, 3.f, 3.f, 0.5f, 1),
                     inst(4.f, 4.f, 5.f, 5.f, 0.5f, 0)};
    auto dets = aegis::normalize_detections(raw, aegis::vocabulary_for(aegis::ModelProfile::COCO));
    ASSERT_EQ(dets.size(), 3u);
    EXPECT_EQ(dets[0].index, 0);
    EXPECT_EQ(dets[1].index, 1);
    EXPECT_EQ(dets[2].index, 2);
}

TEST(DetectionNormalizer, IsDeterministic) {
    const auto vocab = aegis::vocabulary_for(aegis::ModelProfile::MILITARY);
    auto a = aegis::normalize_detections(military_raw(), vocab);
    auto b = aegis::normalize_detections(military_raw(), vocab);
    EXPECT_EQ(a, b);
}

TEST(DetectionNormalizer, NonFiniteValuesNeverEscape) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    RawDetections raw;
    raw.class_names = {{0, "car"}};
    raw.instances = {inst(0.f, 0.f, 10.f, 10.f, nan, 0), inst(nan, 0.f, 5.f, 5.f, 0.9f, 0),
                     inst(0.f, -inf, 5.f, 5.f, 0.8f, 0), inst(0.f, 0.f, 5.f, 5.f, inf, 0)};
    auto dets = aegis::normalize_detections(raw, aegis::vocabulary_for(aegis::ModelProfile::COCO));
    ASSERT_EQ(dets.size(), 2u);
    EXPECT_EQ(dets[0].index, 3);
    EXPECT_FLOAT_EQ(dets[0].confidence, 1.0f);
    EXPECT_EQ(dets[1].index, 0);
    EXPECT_FLOAT_EQ(dets[1].confidence, 0.0f);
    EXPECT_EQ(dets[1].box.x2, 10);
}
