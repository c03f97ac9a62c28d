#include "chatgate/core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

namespace chatgate::core {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

std::string_view provider_kind_name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Stub: return "Stub";
        case ProviderKind::OpenAI: return "OpenAI";
    }
    return "unknown";
}

std::optional<ProviderKind> parse_provider_kind(std::string_view name) {
    if (iequals(name, "stub")) return ProviderKind::Stub;
    if (iequals(name, "openai")) return ProviderKind::OpenAI;
    return std::nullopt;
}

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

std::string resolve_env_reference(const std::string& value) {
    static const std::regex reference(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\}|\$([A-Za-z_][A-Za-z0-9_]*))");
    std::smatch match;
    if (!std::regex_match(value, match, reference)) {
        return value;
    }

    std::string var_name = match[1].matched ? match[1].str() : match[2].str();
    const char* var_value = std::getenv(var_name.c_str());
    return var_value ? var_value : "";
}

fs::path GatewayConfig::default_path() {
    return fs::path(expand_path(std::string("~/.chatgate/config.yaml")));
}

void GatewayConfig::apply_environment() {
    if (const char* key = std::getenv("OPENAI_API_KEY")) {
        if (*key != '\0') {
            openai.api_key = key;
        }
    }
}

Result<void, Error> GatewayConfig::validate() const {
    if (llm.provider.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigKeyMissing,
            "llm.provider must name a backend"
        );
    }

    // Extension providers are checked by the resolver that knows about them
    auto kind = parse_provider_kind(llm.provider);
    if (kind == ProviderKind::OpenAI && openai.api_key.empty()) {
        return Result<void, Error>::err(
            ErrorCode::LLMApiKeyMissing,
            "OpenAI API key required for OpenAI provider",
            "openai.api_key"
        );
    }

    if (kind == ProviderKind::OpenAI && openai.model.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigKeyMissing,
            "openai.model must not be empty"
        );
    }

    if (openai.max_tokens <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "openai.max_tokens must be positive"
        );
    }

    if (openai.timeout_seconds <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "openai.timeout_seconds must be positive"
        );
    }

    if (tokenizer.tokens_per_message < 0 || tokenizer.priming_tokens < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "tokenizer cost constants must not be negative"
        );
    }

    if (stub.first_delay.count() < 0 || stub.second_delay.count() < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "stub delays must not be negative"
        );
    }

    return Result<void, Error>::ok();
}

Result<GatewayConfig, Error> GatewayConfig::load(const fs::path& path) {
    fs::path expanded = expand_path(path.string());

    if (!fs::exists(expanded)) {
        return Result<GatewayConfig, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        GatewayConfig config;

        if (auto llm_node = root["llm"]) {
            config.llm.provider = llm_node["provider"].as<std::string>(config.llm.provider);
            config.llm.reject_oversized_prompt =
                llm_node["reject_oversized_prompt"].as<bool>(config.llm.reject_oversized_prompt);
        }

        if (auto openai_node = root["openai"]) {
            config.openai.api_key = resolve_env_reference(openai_node["api_key"].as<std::string>(""));
            config.openai.model = openai_node["model"].as<std::string>(config.openai.model);
            config.openai.base_url = openai_node["base_url"].as<std::string>(config.openai.base_url);
            config.openai.max_tokens = openai_node["max_tokens"].as<int>(config.openai.max_tokens);
            config.openai.timeout_seconds = openai_node["timeout_seconds"].as<int>(config.openai.timeout_seconds);
        }

        if (auto stub_node = root["stub"]) {
            config.stub.first_delay = Duration{
                stub_node["first_delay_ms"].as<int>(static_cast<int>(config.stub.first_delay.count()))};
            config.stub.second_delay = Duration{
                stub_node["second_delay_ms"].as<int>(static_cast<int>(config.stub.second_delay.count()))};
        }

        if (auto tok_node = root["tokenizer"]) {
            std::string vocab = tok_node["vocab_path"].as<std::string>("");
            if (!vocab.empty()) {
                config.tokenizer.vocab_path = expand_path(vocab);
            }
            config.tokenizer.tokens_per_message =
                tok_node["tokens_per_message"].as<int>(config.tokenizer.tokens_per_message);
            config.tokenizer.priming_tokens =
                tok_node["priming_tokens"].as<int>(config.tokenizer.priming_tokens);
        }

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_pattern = obs_node["log_pattern"].as<std::string>(config.observability.log_pattern);
        }

        // Environment wins over the file
        config.apply_environment();

        CHATGATE_TRY_VOID(config.validate());

        return Result<GatewayConfig, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<GatewayConfig, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<GatewayConfig, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Result<GatewayConfig, Error> GatewayConfig::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok() || result.error().code != ErrorCode::ConfigNotFound) {
        return result;
    }

    spdlog::warn("No configuration at {}, using defaults", result.error().context.value_or(path.string()));

    GatewayConfig config;
    config.apply_environment();
    CHATGATE_TRY_VOID(config.validate());
    return Result<GatewayConfig, Error>::ok(std::move(config));
}

}  // namespace chatgate::core
