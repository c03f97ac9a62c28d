#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chatgate::net {

struct SseEvent {
    std::string event;  // event type, empty for the default "message"
    std::string data;   // data lines joined with '\n'
};

// Incremental Server-Sent Events parser. Fragments may split lines and
// events anywhere; state carries over between feed() calls.
class SseParser {
public:
    // Feed raw body bytes, returns the events completed by them
    std::vector<SseEvent> feed(std::string_view chunk);

    // End of body: dispatch a trailing event that had no blank line after it
    std::vector<SseEvent> finish();

    void reset();

private:
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;

    void process_line(std::string_view line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);
};

}  // namespace chatgate::net
