#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace aegis {

class LlmError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LlmMessage {
    std::string role;
    std::string content;
};

struct LlmResponse {
    std::string text;
    int tokens_used{0};
    std::string model;
};

// External chat-completion service.
class LlmClient {
public:
    virtual ~LlmClient() = default;

    // Throws LlmError when the provider cannot be reached or answers badly.
    virtual LlmResponse generate(const std::string& system_prompt,
                                 const std::string& user_message,
                                 const std::vector<LlmMessage>& history) = 0;

    virtual std::string model() const = 0;
};

enum class LlmProvider { OPENROUTER, OPENAI, GROQ, ANTHROPIC };

// Unknown names map to OPENROUTER.
LlmProvider parse_llm_provider(const std::string& name);
std::string llm_provider_to_string(LlmProvider provider);
std::string default_base_url(LlmProvider provider);

struct LlmSettings {
    LlmProvider provider{LlmProvider::OPENROUTER};
    std::string api_key;
    std::string base_url;     // empty: provider default
    std::string model;
    int max_tokens{2048};
    double temperature{0.7};
    int timeout_sec{60};
};

// OpenAI-compatible /chat/completions (OpenAI, Groq, OpenRouter) or the
// Anthropic /v1/messages API, over cpp-httplib.
class HttpLlmClient : public LlmClient {
public:
    explicit HttpLlmClient(LlmSettings settings);

    LlmResponse generate(const std::string& system_prompt,
                         const std::string& user_message,
                         const std::vector<LlmMessage>& history) override;

    std::string model() const override { return settings_.model; }

private:
    LlmResponse generate_openai(const std::string& system_prompt,
                                const std::string& user_message,
                                const std::vector<LlmMessage>& history);
    LlmResponse generate_anthropic(const std::string& system_prompt,
                                   const std::string& user_message,
                                   const std::vector<LlmMessage>& history);
    std::string post_json(const std::string& path, const std::string& body, bool anthropic_auth);

    LlmSettings settings_;
    std::string origin_;
    std::string prefix_;
};

}  // namespace aegis
