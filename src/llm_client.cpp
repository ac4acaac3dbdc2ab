#include "llm_client.hpp"

#include <cctype>
#include <iostream>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "json_utils.hpp"
#include "url_utils.hpp"

namespace aegis {

LlmProvider parse_llm_provider(const std::string& name) {
    std::string lower;
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "openai") return LlmProvider::OPENAI;
    if (lower == "groq") return LlmProvider::GROQ;
    if (lower == "anthropic") return LlmProvider::ANTHROPIC;
    return LlmProvider::OPENROUTER;
}

std::string llm_provider_to_string(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::OPENAI: return "openai";
        case LlmProvider::GROQ: return "groq";
        case LlmProvider::ANTHROPIC: return "anthropic";
        default: return "openrouter";
    }
}

std::string default_base_url(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::OPENAI: return "https://api.openai.com/v1";
        case LlmProvider::GROQ: return "https://api.groq.com/openai/v1";
        case LlmProvider::ANTHROPIC: return "https://api.anthropic.com/v1";
        default: return "https://openrouter.ai/api/v1";
    }
}

HttpLlmClient::HttpLlmClient(LlmSettings settings) : settings_(std::move(settings)) {
    if (settings_.base_url.empty()) settings_.base_url = default_base_url(settings_.provider);
    auto parts = split_base_url(settings_.base_url);
    origin_ = parts.first;
    prefix_ = parts.second;
    std::cout << "[INFO] LLM client initialized: " << llm_provider_to_string(settings_.provider)
              << " / " << settings_.model << std::endl;
}

std::string HttpLlmClient::post_json(const std::string& path, const std::string& body, bool anthropic_auth) {
    httplib::Client cli(origin_);
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(settings_.timeout_sec, 0);

    httplib::Headers headers;
    if (anthropic_auth) {
        headers.emplace("x-api-key", settings_.api_key);
        headers.emplace("anthropic-version", "2023-06-01");
    } else {
        headers.emplace("Authorization", "Bearer " + settings_.api_key);
    }

    auto res = cli.Post(prefix_ + path, headers, body, "application/json");
    if (!res) {
        throw LlmError("request to " + origin_ + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw LlmError("provider returned HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, 300));
    }
    return res->body;
}

LlmResponse HttpLlmClient::generate(const std::string& system_prompt,
                                    const std::string& user_message,
                                    const std::vector<LlmMessage>& history) {
    try {
        if (settings_.provider == LlmProvider::ANTHROPIC) {
            return generate_anthropic(system_prompt, user_message, history);
        }
        return generate_openai(system_prompt, user_message, history);
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(std::string("malformed provider response: ") + e.what());
    }
}

LlmResponse HttpLlmClient::generate_openai(const std::string& system_prompt,
                                           const std::string& user_message,
                                           const std::vector<LlmMessage>& history) {
    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", system_prompt}});
    for (const auto& m : history) messages.push_back({{"role", m.role}, {"content", m.content}});
    messages.push_back({{"role", "user"}, {"content", user_message}});

    nlohmann::json req{
        {"model", settings_.model},
        {"messages", messages},
        {"max_tokens", settings_.max_tokens},
        {"temperature", settings_.temperature},
    };

    auto resp = nlohmann::json::parse(post_json("/chat/completions", dump_json(req), false));

    LlmResponse out;
    out.model = settings_.model;
    out.text = resp.at("choices").at(0).at("message").at("content").get<std::string>();
    if (resp.contains("usage") && resp["usage"].is_object()) {
        out.tokens_used = resp["usage"].value("total_tokens", 0);
    }
    return out;
}

LlmResponse HttpLlmClient::generate_anthropic(const std::string& system_prompt,
                                              const std::string& user_message,
                                              const std::vector<LlmMessage>& history) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& m : history) messages.push_back({{"role", m.role}, {"content", m.content}});
    messages.push_back({{"role", "user"}, {"content", user_message}});

    nlohmann::json req{
        {"model", settings_.model},
        {"system", system_prompt},
        {"messages", messages},
        {"max_tokens", settings_.max_tokens},
    };

    auto resp = nlohmann::json::parse(post_json("/messages", dump_json(req), true));

    LlmResponse out;
    out.model = settings_.model;
    out.text = resp.at("content").at(0).at("text").get<std::string>();
    if (resp.contains("usage") && resp["usage"].is_object()) {
        out.tokens_used = resp["usage"].value("input_tokens", 0) + resp["usage"].value("output_tokens", 0);
    }
    return out;
}

}  // namespace aegis
