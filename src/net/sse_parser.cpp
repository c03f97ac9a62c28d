#include "chatgate/net/sse_parser.hpp"

namespace chatgate::net {

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;
    buffer_.append(chunk.data(), chunk.size());

    size_t pos = 0;
    while (true) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            break;  // incomplete line stays buffered
        }

        std::string_view line(buffer_.data() + pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        process_line(line, events);
        pos = newline + 1;
    }

    buffer_.erase(0, pos);
    return events;
}

std::vector<SseEvent> SseParser::finish() {
    std::vector<SseEvent> events;
    if (!buffer_.empty()) {
        std::string line = std::move(buffer_);
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(line, events);
    }
    dispatch(events);
    return events;
}

void SseParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

void SseParser::process_line(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    std::string_view field = line;
    std::string_view value;
    if (size_t colon = line.find(':'); colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            data_ += '\n';
        }
        data_.append(value.data(), value.size());
        has_data_ = true;
    } else if (field == "event") {
        event_.assign(value.data(), value.size());
    }
    // id and retry are irrelevant for a single request
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (has_data_) {
        out.push_back(SseEvent{event_, data_});
    }
    event_.clear();
    data_.clear();
    has_data_ = false;
}

}  // namespace chatgate::net
