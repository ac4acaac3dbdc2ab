#include <gtest/gtest.h>

#include "analyst.hpp"
#include "fakes.hpp"
#include "test_support.hpp"
#include "threat_assessor.hpp"

using aegis::Analyst;
using aegis::RiskTier;
using aegis::testing::FakeLlm;
using aegis::testing::make_detection;

TEST(Analyst, FramePositionUsesThirds) {
    EXPECT_EQ(aegis::frame_position(50, 50, 300, 300), "top-left");
    EXPECT_EQ(aegis::frame_position(150, 150, 300, 300), "center");
    EXPECT_EQ(aegis::frame_position(250, 150, 300, 300), "middle-right");
    EXPECT_EQ(aegis::frame_position(150, 280, 300, 300), "bottom-center");
}

TEST(Analyst, ContextListsObjects) {
    std::vector<aegis::Detection> dets = {
        make_detection("tank", 0.95f, RiskTier::HIGH, 0, aegis::BoundingBox{0, 0, 100, 50})};
    auto ctx = aegis::build_detection_context(dets, aegis::assess_threat(dets), 640, 480, 12.34);

    EXPECT_NE(ctx.find("Resolution: 640x480 pixels"), std::string::npos);
    EXPECT_NE(ctx.find("Inference time: 12.3ms"), std::string::npos);
    EXPECT_NE(ctx.find("Level: HIGH"), std::string::npos);
    EXPECT_NE(ctx.find("1. TANK [HIGH RISK]"), std::string::npos);
    EXPECT_NE(ctx.find("Confidence: 95.0%"), std::string::npos);
    EXPECT_NE(ctx.find("Position: top-left of frame"), std::string::npos);
    EXPECT_NE(ctx.find("Size: 100x50 pixels"), std::string::npos);
}

TEST(Analyst, ContextForEmptyScan) {
    auto ctx = aegis::build_detection_context({}, aegis::assess_threat({}), 10, 10, 1.0);
    EXPECT_NE(ctx.find("Level: CLEAR"), std::string::npos);
    EXPECT_NE(ctx.find("DETECTED OBJECTS: None"), std::string::npos);
}

TEST(Analyst, DisabledReturnsReason) {
    Analyst analyst(nullptr, "no key");
    EXPECT_FALSE(analyst.enabled());
    auto r = analyst.generate_sitrep("ctx");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "no key");
    auto c = analyst.chat("id", "hi", aegis::ScanArtifact{});
    EXPECT_FALSE(c.success);
    EXPECT_EQ(c.error, "no key");
}

TEST(Analyst, SitrepUsesFixedPrompt) {
    FakeLlm llm;
    Analyst analyst(&llm, "");
    auto r = analyst.generate_sitrep("IMAGE SCAN ANALYSIS");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.sitrep, "SITREP: two tanks.");
    EXPECT_EQ(r.model, "fake-model");
    EXPECT_EQ(r.tokens, 77);
    EXPECT_EQ(llm.last_system, aegis::analyst_system_prompt());
    EXPECT_NE(llm.last_user.find("IMAGE SCAN ANALYSIS"), std::string::npos);
}

TEST(Analyst, LlmFailureDegrades) {
    FakeLlm llm;
    llm.fail = true;
    Analyst analyst(&llm, "");
    aegis::SitrepResult r;
    EXPECT_NO_THROW(r = analyst.generate_sitrep("ctx"));
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("provider unreachable"), std::string::npos);
}

TEST(Analyst, ChatCarriesContextAndHistory) {
    FakeLlm llm;
    llm.reply = "Two tanks, north-west.";
    Analyst analyst(&llm, "");

    aegis::ScanArtifact artifact;
    artifact.detection_context = "DETECTED OBJECTS (2 total)";
    artifact.sitrep = "SITREP: two tanks.";
    artifact.chat_history = {{"user", "how many?"}, {"assistant", "two"}};

    auto c = analyst.chat("a1b2c3d4", "where?", artifact);
    ASSERT_TRUE(c.success);
    EXPECT_EQ(c.answer, "Two tanks, north-west.");
    EXPECT_NE(llm.last_system.find("Scan ID: a1b2c3d4"), std::string::npos);
    EXPECT_NE(llm.last_system.find("DETECTED OBJECTS (2 total)"), std::string::npos);
    EXPECT_EQ(llm.last_user, "where?");
    ASSERT_EQ(llm.last_history.size(), 2u);
    EXPECT_EQ(llm.last_history[1].role, "assistant");
}
