#include <gtest/gtest.h>

#include "test_support.hpp"
#include "threat_assessor.hpp"

using aegis::RiskTier;
using aegis::ThreatLevel;
using aegis::testing::make_detection;

TEST(ThreatAssessor, LevelRules) {
    EXPECT_EQ(aegis::threat_level_for(0, 0, 0), ThreatLevel::CLEAR);
    EXPECT_EQ(aegis::threat_level_for(2, 2, 0), ThreatLevel::CRITICAL);
    EXPECT_EQ(aegis::threat_level_for(5, 1, 4), ThreatLevel::HIGH);
    EXPECT_EQ(aegis::threat_level_for(2, 0, 2), ThreatLevel::ELEVATED);
    EXPECT_EQ(aegis::threat_level_for(3, 0, 1), ThreatLevel::LOW);
    EXPECT_EQ(aegis::threat_level_for(1, 0, 0), ThreatLevel::LOW);
}

TEST(ThreatAssessor, TwoTanksAreCritical) {
    std::vector<aegis::Detection> dets = {make_detection("tank", 0.95f, RiskTier::HIGH, 1),
                                          make_detection("tank", 0.9f, RiskTier::HIGH, 0)};
    auto report = aegis::assess_threat(dets);
    EXPECT_EQ(report.level, ThreatLevel::CRITICAL);
    EXPECT_EQ(report.label, "CRITICAL THREAT");
    EXPECT_EQ(report.color, "#ff1744");
    EXPECT_EQ(report.stats.total, 2);
    EXPECT_EQ(report.stats.high_risk, 2);
    EXPECT_DOUBLE_EQ(report.stats.avg_confidence, 0.925);
    EXPECT_DOUBLE_EQ(report.stats.max_confidence, 0.95);
    EXPECT_EQ(report.stats.class_counts.at("tank"), 2);
    EXPECT_EQ(report.high_risk_hits, (std::vector<std::string>{"tank", "tank"}));
}

TEST(ThreatAssessor, TwoMediumsAreElevated) {
    std::vector<aegis::Detection> dets = {make_detection("military_truck", 0.6f, RiskTier::MEDIUM),
                                          make_detection("radar_station", 0.5f, RiskTier::MEDIUM)};
    auto report = aegis::assess_threat(dets);
    EXPECT_EQ(report.level, ThreatLevel::ELEVATED);
    EXPECT_EQ(report.label, "ELEVATED RISK");
    EXPECT_EQ(report.stats.medium_risk, 2);
    EXPECT_TRUE(report.high_risk_hits.empty());
}

TEST(ThreatAssessor, EmptySetIsClearWithZeroStats) {
    auto report = aegis::assess_threat({});
    EXPECT_EQ(report.level, ThreatLevel::CLEAR);
    EXPECT_EQ(report.label, "ALL CLEAR");
    EXPECT_EQ(report.stats.total, 0);
    EXPECT_DOUBLE_EQ(report.stats.avg_confidence, 0.0);
    EXPECT_DOUBLE_EQ(report.stats.max_confidence, 0.0);
    EXPECT_TRUE(report.stats.class_counts.empty());
}

TEST(ThreatAssessor, ClassCountsAreCaseSensitive) {
    std::vector<aegis::Detection> dets = {make_detection("Car", 0.5f, RiskTier::HIGH),
                                          make_detection("car", 0.5f, RiskTier::HIGH)};
    auto stats = aegis::compute_stats(dets);
    EXPECT_EQ(stats.class_counts.size(), 2u);
}

TEST(ThreatAssessor, AssessmentIsPure) {
    std::vector<aegis::Detection> dets = {make_detection("tank", 0.8f, RiskTier::HIGH),
                                          make_detection("person", 0.4f, RiskTier::MEDIUM)};
    auto a = aegis::assess_threat(dets);
    auto b = aegis::assess_threat(dets);
    EXPECT_EQ(a.level, b.level);
    EXPECT_EQ(a.high_risk_hits, b.high_risk_hits);
    EXPECT_EQ(a.stats.class_counts, b.stats.class_counts);
    EXPECT_EQ(a.level, ThreatLevel::HIGH);
}
