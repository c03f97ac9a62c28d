#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatgate::core {

// JSON alias
using Json = nlohmann::json;

using Duration = std::chrono::milliseconds;

// Message roles
enum class Role {
    System,
    User,
    Assistant
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

// A single chat message. Immutable once constructed: there are no setters,
// so a history handed to the gateway cannot be edited through it.
class Message {
public:
    Message(Role role, std::string content)
        : role_(role), content_(std::move(content)) {}

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    Role role() const { return role_; }
    const std::string& content() const { return content_; }

    // Chat-completion wire shape: {"role": ..., "content": ...}
    Json to_json() const {
        return Json{
            {"role", std::string(role_to_string(role_))},
            {"content", content_}
        };
    }

    bool operator==(const Message& other) const {
        return role_ == other.role_ && content_ == other.content_;
    }

private:
    Role role_;
    std::string content_;
};

}  // namespace chatgate::core
