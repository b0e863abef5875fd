#pragma once
#include "config.hpp"
#include "message.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace bashbuddy {

struct ProviderResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// ── Error classification for provider retry ─────────────────────────
enum class ProviderErrorKind {
    unknown,
    rate_limit,
    timeout,
    overloaded,
    context_overflow,
    auth,
    billing
};

ProviderErrorKind classify_provider_error(const std::string& error_text);
bool is_retryable_error(ProviderErrorKind kind);

// The remote text-generation service as seen by the orchestrator.
// Implementations throw std::runtime_error on transport or protocol failure.
class GenerationService {
public:
    virtual ~GenerationService() = default;
    virtual ProviderResponse generate(const std::vector<Message>& messages,
                                      const nlohmann::json& tools_spec) = 0;
};

// Parses an OpenAI-compatible chat completion body. Tool calls the model
// wrote inline (<tool_call> tags, ```json fences) are recovered when the
// native tool_calls field is absent. Throws std::runtime_error on bad JSON.
ProviderResponse parse_chat_completion(const std::string& body);

class Provider : public GenerationService {
public:
    explicit Provider(const Config& cfg);

    ProviderResponse generate(const std::vector<Message>& messages,
                              const nlohmann::json& tools_spec) override;

private:
    std::string api_key_;
    std::string model_;
    int max_tokens_;
    double temperature_;
    int read_timeout_sec_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

} // namespace bashbuddy
