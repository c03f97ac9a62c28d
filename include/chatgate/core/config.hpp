#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chatgate::core {

namespace fs = std::filesystem;

// Built-in backends. Names outside this set can only be served by an
// extension registered on the AdapterResolver.
enum class ProviderKind {
    Stub,
    OpenAI
};

std::string_view provider_kind_name(ProviderKind kind);

// Case-insensitive; nullopt for anything that is not a built-in backend
std::optional<ProviderKind> parse_provider_kind(std::string_view name);

// Provider selection
struct LLMConfig {
    std::string provider = "Stub";  // Stub | OpenAI

    // Fail with LLMContextOverflow when [context, prompt] alone cannot fit
    // the budget, instead of sending the request with an empty history.
    bool reject_oversized_prompt = false;
};

// Remote chat-completion endpoint
struct OpenAIConfig {
    std::string api_key;  // From env: OPENAI_API_KEY
    std::string model = "gpt-4.1-mini";
    std::string base_url = "https://api.openai.com";
    int max_tokens = 8000;
    int timeout_seconds = 240;
};

// Artificial latency of the stub backend
struct StubConfig {
    Duration first_delay{1000};
    Duration second_delay{2000};
};

// Token cost model
struct TokenizerConfig {
    fs::path vocab_path;  // tiktoken rank file; empty selects the approximate encoder
    int tokens_per_message = 3;
    int priming_tokens = 3;
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

// Main configuration. Built once at start-up and passed by const reference;
// nothing in the gateway mutates it afterwards.
struct GatewayConfig {
    LLMConfig llm;
    OpenAIConfig openai;
    StubConfig stub;
    TokenizerConfig tokenizer;
    ObservabilityConfig observability;

    // Load configuration from a YAML file, apply environment overrides, validate
    static Result<GatewayConfig, Error> load(const fs::path& path);

    // Like load(), but a missing file yields the defaults plus environment.
    // A file that exists and fails to parse or validate is still an error.
    static Result<GatewayConfig, Error> load_or_default(const fs::path& path = default_path());

    // Get default config path
    static fs::path default_path();

    // Pick up OPENAI_API_KEY from the environment
    void apply_environment();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables
std::string expand_path(const std::string& path);

// "${VAR}" or "$VAR" as the whole value resolves to the variable; any other
// value is returned as written
std::string resolve_env_reference(const std::string& value);

}  // namespace chatgate::core
