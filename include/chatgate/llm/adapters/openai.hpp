#pragma once

#include "chatgate/core/config.hpp"
#include "chatgate/llm/history_truncator.hpp"
#include "chatgate/llm/llm_adapter.hpp"
#include "chatgate/net/http_transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace chatgate::llm {

// Streams replies from an OpenAI-compatible chat-completions endpoint.
// History is trimmed to openai.max_tokens before each request.
class OpenAIAdapter : public LLMAdapter {
public:
    OpenAIAdapter(const OpenAIConfig& config,
                  TokenCounter counter,
                  std::shared_ptr<net::HttpTransport> transport,
                  bool reject_oversized_prompt = false);

    std::string name() const override { return "openai"; }
    bool is_available() const override;

    Result<ChunkStream, Error> generate(const std::string& context,
                                        const std::vector<Message>& history,
                                        const std::string& prompt) const override;

    // Request body for a complete message list
    Json build_request_body(const std::vector<Message>& messages) const;

    const HistoryTruncator& truncator() const { return truncator_; }

    static constexpr const char* kCompletionsPath = "/v1/chat/completions";

private:
    OpenAIConfig config_;
    HistoryTruncator truncator_;
    std::shared_ptr<net::HttpTransport> transport_;
    bool reject_oversized_prompt_;
};

}  // namespace chatgate::llm
