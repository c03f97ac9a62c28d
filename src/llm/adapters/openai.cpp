#include "chatgate/llm/adapters/openai.hpp"
#include "chatgate/net/sse_parser.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <optional>

namespace chatgate::llm {

namespace {

using NextResult = Result<std::optional<std::string>, Error>;

// Provider error bodies look like {"error": {"message": ..., "type": ...}}
std::string describe_error_body(const std::string& body) {
    try {
        Json j = Json::parse(body);
        if (j.contains("error") && j["error"].is_object()) {
            return j["error"].value("message", body);
        }
    } catch (const Json::exception&) {
        // Not JSON; report the raw body
    }
    return body;
}

// Reads SSE from the connection and turns completion units into text deltas
class OpenAIChunkSource : public ChunkSource {
public:
    explicit OpenAIChunkSource(std::unique_ptr<net::StreamConnection> connection)
        : connection_(std::move(connection))
    {
    }

    ~OpenAIChunkSource() override {
        close();
    }

    NextResult next() override {
        while (true) {
            if (!pending_.empty()) {
                std::string chunk = std::move(pending_.front());
                pending_.pop_front();
                return NextResult::ok(std::move(chunk));
            }
            // Deltas received ahead of a failure are delivered first
            if (failure_) {
                close();
                return NextResult::err(*failure_);
            }
            if (done_) {
                close();
                return NextResult::ok(std::nullopt);
            }

            auto fragment = connection_->read();
            if (fragment.is_err()) {
                spdlog::error("OpenAI stream failed: {}", fragment.error().to_string());
                failure_ = std::move(fragment).error();
                continue;
            }

            std::vector<net::SseEvent> events;
            if (fragment.value()) {
                events = parser_.feed(*fragment.value());
            } else {
                events = parser_.finish();
                done_ = true;
            }

            for (const auto& event : events) {
                auto handled = handle_event(event);
                if (handled.is_err()) {
                    failure_ = std::move(handled).error();
                    break;
                }
                if (done_) break;
            }
        }
    }

    void close() override {
        if (connection_ && !connection_->is_closed()) {
            connection_->close();
        }
    }

private:
    std::unique_ptr<net::StreamConnection> connection_;
    net::SseParser parser_;
    std::deque<std::string> pending_;
    std::optional<Error> failure_;
    bool done_ = false;

    Result<void, Error> handle_event(const net::SseEvent& event) {
        if (event.data == "[DONE]") {
            done_ = true;
            return Result<void, Error>::ok();
        }

        try {
            Json unit = Json::parse(event.data);

            if (unit.contains("error")) {
                std::string message = unit["error"].is_object()
                    ? unit["error"].value("message", "Unknown provider error")
                    : unit["error"].dump();
                return Result<void, Error>::err(ErrorCode::LLMStreamError, message);
            }

            // Units without choices (usage reports, keep-alives) carry no text
            if (!unit.contains("choices") || !unit["choices"].is_array() || unit["choices"].empty()) {
                return Result<void, Error>::ok();
            }

            const auto& choice = unit["choices"][0];
            if (!choice.contains("delta") || !choice["delta"].is_object()) {
                return Result<void, Error>::ok();
            }

            const auto& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                std::string text = delta["content"].get<std::string>();
                if (!text.empty()) {
                    pending_.push_back(std::move(text));
                }
            }
            return Result<void, Error>::ok();

        } catch (const Json::exception& e) {
            return Result<void, Error>::err(
                ErrorCode::LLMStreamError,
                std::string("Malformed stream unit: ") + e.what()
            );
        }
    }
};

}  // namespace

OpenAIAdapter::OpenAIAdapter(const OpenAIConfig& config,
                             TokenCounter counter,
                             std::shared_ptr<net::HttpTransport> transport,
                             bool reject_oversized_prompt)
    : config_(config)
    , truncator_(std::move(counter))
    , transport_(std::move(transport))
    , reject_oversized_prompt_(reject_oversized_prompt)
{
}

bool OpenAIAdapter::is_available() const {
    return !config_.api_key.empty() && transport_ != nullptr;
}

Json OpenAIAdapter::build_request_body(const std::vector<Message>& messages) const {
    Json formatted = Json::array();
    for (const auto& msg : messages) {
        formatted.push_back(msg.to_json());
    }

    Json body;
    body["model"] = config_.model;
    body["messages"] = std::move(formatted);
    body["stream"] = true;
    return body;
}

Result<ChunkStream, Error> OpenAIAdapter::generate(const std::string& context,
                                                   const std::vector<Message>& history,
                                                   const std::string& prompt) const {
    if (config_.api_key.empty()) {
        return Result<ChunkStream, Error>::err(
            ErrorCode::LLMApiKeyMissing,
            "OpenAI API key not set",
            "openai.api_key"
        );
    }
    if (!transport_) {
        return Result<ChunkStream, Error>::err(
            ErrorCode::InvalidState,
            "OpenAI adapter has no HTTP transport"
        );
    }

    if (reject_oversized_prompt_ && !truncator_.fits(context, prompt, config_.max_tokens)) {
        return Result<ChunkStream, Error>::err(
            ErrorCode::LLMContextOverflow,
            "Context and prompt exceed the budget of " + std::to_string(config_.max_tokens) + " tokens"
        );
    }

    std::vector<Message> kept = truncator_.truncate(context, history, prompt, config_.max_tokens);

    std::vector<Message> messages;
    messages.reserve(kept.size() + 2);
    messages.push_back(Message::system(context));
    messages.insert(messages.end(), kept.begin(), kept.end());
    messages.push_back(Message::user(prompt));

    spdlog::debug("OpenAI request: model={}, history={}/{}, estimated_tokens={}",
                  config_.model, kept.size(), history.size(),
                  truncator_.counter().count(messages));

    net::HttpRequest request;
    request.base_url = config_.base_url;
    request.path = kCompletionsPath;
    request.headers = {
        {"Authorization", "Bearer " + config_.api_key},
        {"Accept", "text/event-stream"}
    };
    request.body = build_request_body(messages).dump();
    request.timeout = std::chrono::seconds(config_.timeout_seconds);

    auto connection = transport_->open_stream(request);
    if (connection.is_err()) {
        Error error = std::move(connection).error();
        error.message = describe_error_body(error.message);
        error.source = "openai";
        spdlog::error("OpenAI request failed: {}", error.to_string());
        return Result<ChunkStream, Error>::err(std::move(error));
    }

    return Result<ChunkStream, Error>::ok(
        ChunkStream(std::make_unique<OpenAIChunkSource>(std::move(connection).value())));
}

}  // namespace chatgate::llm
