#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace aegis {

namespace {

bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

int to_int(const char* name, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(std::string("invalid integer for ") + name + ": '" + value + "'");
    }
}

double to_double(const char* name, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(std::string("invalid number for ") + name + ": '" + value + "'");
    }
}

const char* api_key_variable(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::OPENAI: return "OPENAI_API_KEY";
        case LlmProvider::GROQ: return "GROQ_API_KEY";
        case LlmProvider::ANTHROPIC: return "ANTHROPIC_API_KEY";
        default: return "OPENROUTER_API_KEY";
    }
}

std::string default_llm_model(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::OPENAI: return "gpt-4o-mini";
        case LlmProvider::GROQ: return "llama-3.3-70b-versatile";
        case LlmProvider::ANTHROPIC: return "claude-3-5-haiku-latest";
        default: return "meta-llama/llama-3.3-70b-instruct";
    }
}

void print_usage() {
    std::cout << "Usage: aegis_server [--host <addr>] [--port <int>] [--model-type auto|military|dota|coco]\n"
              << "                    [--model <onnx>] [--models-dir <dir>] [--class-names <file>]\n"
              << "                    [--img <size>] [--conf <thresh>] [--iou <thresh>] [--max-det <int>]\n"
              << "                    [--uploads <dir>] [--log <csv>] [--sitreps <json>] [--sitrep-retain <int>]\n"
              << "                    [--use-ort|--no-ort] [--no-geocoder] [--compact-days <int>]\n"
              << "       aegis_scan   [same flags] <image>...\n"
              << "Environment: HOST PORT MODEL_TYPE MODEL_PATH CLASS_NAMES UPLOAD_FOLDER LOG_PATH\n"
              << "             SITREP_STORE_PATH CONFIDENCE_THRESH IOU_THRESH MAX_DETECTIONS IMG_SIZE\n"
              << "             LLM_PROVIDER LLM_MODEL LLM_BASE_URL LLM_MAX_TOKENS LLM_TEMPERATURE\n"
              << "             OPENROUTER_API_KEY OPENAI_API_KEY GROQ_API_KEY ANTHROPIC_API_KEY GEOCODER_URL\n";
}

}  // namespace

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* v = std::getenv("HOST")) cfg.host = v;
    if (const char* v = std::getenv("PORT")) cfg.port = to_int("PORT", v);
    if (const char* v = std::getenv("MODEL_TYPE")) cfg.model_profile = parse_model_profile(v);
    if (const char* v = std::getenv("MODEL_PATH")) cfg.model_path = v;
    if (const char* v = std::getenv("CLASS_NAMES")) cfg.class_names_path = v;
    if (const char* v = std::getenv("UPLOAD_FOLDER")) cfg.upload_folder = v;
    if (const char* v = std::getenv("LOG_PATH")) cfg.log_path = v;
    if (const char* v = std::getenv("SITREP_STORE_PATH")) cfg.sitrep_store_path = v;
    if (const char* v = std::getenv("CONFIDENCE_THRESH")) cfg.conf_threshold = static_cast<float>(to_double("CONFIDENCE_THRESH", v));
    if (const char* v = std::getenv("IOU_THRESH")) cfg.iou_threshold = static_cast<float>(to_double("IOU_THRESH", v));
    if (const char* v = std::getenv("MAX_DETECTIONS")) cfg.max_detections = to_int("MAX_DETECTIONS", v);
    if (const char* v = std::getenv("IMG_SIZE")) cfg.img_size = to_int("IMG_SIZE", v);

    if (const char* v = std::getenv("LLM_PROVIDER")) cfg.llm.provider = parse_llm_provider(v);
    if (const char* v = std::getenv("LLM_MODEL")) cfg.llm.model = v;
    if (const char* v = std::getenv("LLM_BASE_URL")) cfg.llm.base_url = v;
    if (const char* v = std::getenv("LLM_MAX_TOKENS")) cfg.llm.max_tokens = to_int("LLM_MAX_TOKENS", v);
    if (const char* v = std::getenv("LLM_TEMPERATURE")) cfg.llm.temperature = to_double("LLM_TEMPERATURE", v);
    if (const char* v = std::getenv(api_key_variable(cfg.llm.provider))) cfg.llm.api_key = v;
    if (cfg.llm.model.empty()) cfg.llm.model = default_llm_model(cfg.llm.provider);

    if (const char* v = std::getenv("GEOCODER_URL")) cfg.geocoder_url = v;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--host") && next()) {
            cfg.host = next();
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.port = to_int("--port", next());
            i++;
        } else if (arg_eq(arg, "--model-type") && next()) {
            cfg.model_profile = parse_model_profile(next());
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.model_path = next();
            i++;
        } else if (arg_eq(arg, "--models-dir") && next()) {
            cfg.models_dir = next();
            i++;
        } else if (arg_eq(arg, "--class-names") && next()) {
            cfg.class_names_path = next();
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.img_size = to_int("--img", next());
            i++;
        } else if (arg_eq(arg, "--conf") && next()) {
            cfg.conf_threshold = static_cast<float>(to_double("--conf", next()));
            i++;
        } else if (arg_eq(arg, "--iou") && next()) {
            cfg.iou_threshold = static_cast<float>(to_double("--iou", next()));
            i++;
        } else if (arg_eq(arg, "--max-det") && next()) {
            cfg.max_detections = to_int("--max-det", next());
            i++;
        } else if (arg_eq(arg, "--uploads") && next()) {
            cfg.upload_folder = next();
            i++;
        } else if (arg_eq(arg, "--log") && next()) {
            cfg.log_path = next();
            i++;
        } else if (arg_eq(arg, "--sitreps") && next()) {
            cfg.sitrep_store_path = next();
            i++;
        } else if (arg_eq(arg, "--sitrep-retain") && next()) {
            int n = to_int("--sitrep-retain", next());
            if (n < 0) throw ConfigError("--sitrep-retain must not be negative");
            cfg.sitrep_retain = static_cast<size_t>(n);
            i++;
        } else if (arg_eq(arg, "--compact-days") && next()) {
            cfg.compact_days = to_int("--compact-days", next());
            if (cfg.compact_days <= 0) throw ConfigError("--compact-days must be positive");
            i++;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--no-geocoder")) {
            cfg.geocoder_enabled = false;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else if (std::strncmp(arg, "--", 2) == 0) {
            throw ConfigError(std::string("unknown or incomplete option: ") + arg);
        } else {
            cfg.inputs.emplace_back(arg);
        }
    }

    if (cfg.port <= 0 || cfg.port > 65535) throw ConfigError("port out of range: " + std::to_string(cfg.port));
    if (cfg.img_size <= 0) throw ConfigError("image size must be positive");

    if (cfg.model_path.empty()) cfg.model_path = resolve_weights(cfg.model_profile, cfg.models_dir);

    return cfg;
}

}  // namespace aegis
