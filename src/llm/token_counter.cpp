#include "chatgate/llm/token_counter.hpp"

#include <stdexcept>

namespace chatgate::llm {

int ApproximateEncoder::count(std::string_view text) const {
    // ceil(len / 3.5); any non-empty text costs at least one token
    return static_cast<int>((text.size() * 2 + 6) / 7);
}

TokenCounter::TokenCounter(std::shared_ptr<const Encoder> encoder,
                           int tokens_per_message,
                           int priming_tokens)
    : encoder_(std::move(encoder))
    , tokens_per_message_(tokens_per_message)
    , priming_tokens_(priming_tokens)
{
    if (!encoder_) {
        throw std::invalid_argument("TokenCounter requires an encoder");
    }
}

int TokenCounter::count(const Message& message) const {
    return tokens_per_message_ + encoder_->count(message.content());
}

int TokenCounter::count(const std::vector<Message>& messages) const {
    int tokens = priming_tokens_;
    for (const auto& msg : messages) {
        tokens += count(msg);
    }
    return tokens;
}

}  // namespace chatgate::llm
