#include <gtest/gtest.h>

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

#include "config.hpp"

using aegis::AppConfig;
using aegis::ConfigError;

namespace {

const char* kVariables[] = {"HOST", "PORT", "MODEL_TYPE", "MODEL_PATH", "CLASS_NAMES", "UPLOAD_FOLDER",
                            "LOG_PATH", "SITREP_STORE_PATH", "CONFIDENCE_THRESH", "IOU_THRESH",
                            "MAX_DETECTIONS", "IMG_SIZE", "LLM_PROVIDER", "LLM_MODEL", "LLM_BASE_URL",
                            "LLM_MAX_TOKENS", "LLM_TEMPERATURE", "OPENROUTER_API_KEY", "OPENAI_API_KEY",
                            "GROQ_API_KEY", "ANTHROPIC_API_KEY", "GEOCODER_URL"};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* v : kVariables) unsetenv(v);
    }
    void TearDown() override {
        for (const char* v : kVariables) unsetenv(v);
    }

    AppConfig parse(std::initializer_list<const char*> args) {
        storage_.clear();
        storage_.emplace_back("aegis_server");
        for (const char* a : args) storage_.emplace_back(a);
        argv_.clear();
        for (auto& s : storage_) argv_.push_back(&s[0]);
        return aegis::parse_args(static_cast<int>(argv_.size()), argv_.data());
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

}  // namespace

TEST_F(ConfigTest, Defaults) {
    auto cfg = parse({});
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.model_profile, aegis::ModelProfile::AUTO);
    EXPECT_EQ(cfg.log_path, "logs/detections.csv");
    EXPECT_FLOAT_EQ(cfg.conf_threshold, 0.25f);
    EXPECT_TRUE(cfg.use_ort);
    EXPECT_FALSE(cfg.analyst_enabled());
    EXPECT_EQ(cfg.model_path, "models/yolo11n.onnx");
}

TEST_F(ConfigTest, EnvironmentThenFlags) {
    setenv("PORT", "8080", 1);
    setenv("MODEL_TYPE", "military", 1);
    setenv("CONFIDENCE_THRESH", "0.4", 1);
    auto cfg = parse({"--port", "9090", "--no-ort"});
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.model_profile, aegis::ModelProfile::MILITARY);
    EXPECT_FLOAT_EQ(cfg.conf_threshold, 0.4f);
    EXPECT_FALSE(cfg.use_ort);
}

TEST_F(ConfigTest, ExplicitModelPathWins) {
    setenv("MODEL_PATH", "/opt/weights.onnx", 1);
    auto cfg = parse({"--model-type", "dota"});
    EXPECT_EQ(cfg.model_path, "/opt/weights.onnx");
}

TEST_F(ConfigTest, AnalystNeedsProviderKey) {
    setenv("LLM_PROVIDER", "groq", 1);
    setenv("OPENAI_API_KEY", "wrong-provider", 1);
    EXPECT_FALSE(parse({}).analyst_enabled());

    setenv("GROQ_API_KEY", "gsk", 1);
    auto cfg = parse({});
    EXPECT_TRUE(cfg.analyst_enabled());
    EXPECT_EQ(cfg.llm.provider, aegis::LlmProvider::GROQ);
    EXPECT_EQ(cfg.llm.api_key, "gsk");
    EXPECT_FALSE(cfg.llm.model.empty());
}

TEST_F(ConfigTest, MalformedNumbersThrow) {
    setenv("PORT", "eighty", 1);
    EXPECT_THROW(parse({}), ConfigError);
    unsetenv("PORT");
    EXPECT_THROW(parse({"--conf", "high"}), ConfigError);
    EXPECT_THROW(parse({"--port", "70000"}), ConfigError);
    EXPECT_THROW(parse({"--compact-days", "0"}), ConfigError);
}

TEST_F(ConfigTest, UnknownOptionThrows) {
    EXPECT_THROW(parse({"--frobnicate"}), ConfigError);
}

TEST_F(ConfigTest, PositionalInputsAndMaintenanceFlags) {
    auto cfg = parse({"--compact-days", "30", "a.jpg", "--no-geocoder", "b.png"});
    EXPECT_EQ(cfg.compact_days, 30);
    EXPECT_FALSE(cfg.geocoder_enabled);
    EXPECT_EQ(cfg.inputs, (std::vector<std::string>{"a.jpg", "b.png"}));
}
