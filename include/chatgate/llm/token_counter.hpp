#pragma once

#include "chatgate/core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chatgate::llm {

using namespace chatgate::core;

// Maps text to an estimated token count. Implementations must be pure and
// safe to share between concurrent conversations.
class Encoder {
public:
    virtual ~Encoder() = default;

    virtual std::string name() const = 0;

    virtual int count(std::string_view text) const = 0;
};

// Character-ratio estimate (~3.5 characters per token, rounded up).
// Used when no vocabulary file is configured.
class ApproximateEncoder : public Encoder {
public:
    std::string name() const override { return "approximate"; }

    int count(std::string_view text) const override;
};

// Estimates the cost of a message list the way chat-completion APIs bill it:
// every message carries a fixed framing overhead on top of its content, and
// the reply is primed with a few tokens of its own.
class TokenCounter {
public:
    static constexpr int kDefaultTokensPerMessage = 3;
    static constexpr int kDefaultPrimingTokens = 3;

    explicit TokenCounter(std::shared_ptr<const Encoder> encoder,
                          int tokens_per_message = kDefaultTokensPerMessage,
                          int priming_tokens = kDefaultPrimingTokens);

    // Total estimated cost of the messages, priming included
    int count(const std::vector<Message>& messages) const;

    // Cost of one message without priming
    int count(const Message& message) const;

    const Encoder& encoder() const { return *encoder_; }
    int tokens_per_message() const { return tokens_per_message_; }
    int priming_tokens() const { return priming_tokens_; }

private:
    std::shared_ptr<const Encoder> encoder_;
    int tokens_per_message_;
    int priming_tokens_;
};

}  // namespace chatgate::llm
