#include "chatgate/llm/history_truncator.hpp"

#include <spdlog/spdlog.h>

namespace chatgate::llm {

HistoryTruncator::HistoryTruncator(TokenCounter counter)
    : counter_(std::move(counter))
{
}

std::vector<Message> HistoryTruncator::candidate(const std::string& context,
                                                 std::vector<Message>::const_iterator first,
                                                 std::vector<Message>::const_iterator last,
                                                 const std::string& prompt) {
    std::vector<Message> messages;
    messages.reserve(static_cast<size_t>(last - first) + 2);
    messages.push_back(Message::system(context));
    messages.insert(messages.end(), first, last);
    messages.push_back(Message::user(prompt));
    return messages;
}

std::vector<Message> HistoryTruncator::truncate(const std::string& context,
                                                const std::vector<Message>& history,
                                                const std::string& prompt,
                                                int budget) const {
    auto first = history.begin();

    while (counter_.count(candidate(context, first, history.end(), prompt)) >= budget) {
        if (first == history.end()) {
            spdlog::warn("Context and prompt alone exceed the token budget of {}", budget);
            return {};
        }
        ++first;
    }

    if (first != history.begin()) {
        spdlog::info("Dropped {} of {} history messages to fit {} tokens",
                     first - history.begin(), history.size(), budget);
    }

    return std::vector<Message>(first, history.end());
}

bool HistoryTruncator::fits(const std::string& context, const std::string& prompt, int budget) const {
    std::vector<Message> minimal;
    return counter_.count(candidate(context, minimal.cbegin(), minimal.cend(), prompt)) < budget;
}

}  // namespace chatgate::llm
