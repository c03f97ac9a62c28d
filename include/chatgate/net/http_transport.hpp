#pragma once

#include "chatgate/core/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatgate::net {

using namespace chatgate::core;

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string base_url;  // scheme://host[:port]
    std::string path;
    std::vector<Header> headers;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::seconds timeout{240};  // whole request, headers to last byte
};

// One open streaming response. The body is pulled fragment by fragment;
// closing releases the underlying socket even if the body is not drained.
class StreamConnection {
public:
    virtual ~StreamConnection() = default;

    // Next body fragment, or nullopt once the body is complete
    virtual Result<std::optional<std::string>, Error> read() = 0;

    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

// Abstract HTTP client (injectable for testing)
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Sends the request and blocks until the response headers arrive.
    // Non-2xx responses are returned as errors carrying the response body.
    virtual Result<std::unique_ptr<StreamConnection>, Error> open_stream(const HttpRequest& request) = 0;
};

// Map an HTTP status outside 2xx to a transport error code
ErrorCode error_code_for_status(int status);

}  // namespace chatgate::net
