#pragma once

#include "chatgate/net/http_transport.hpp"

namespace chatgate::net {

// cpp-httplib backed transport (HTTPS via OpenSSL).
//
// httplib delivers a body by pushing it into a callback from inside the
// blocking send(), so each connection runs that call on its own reader
// thread and hands fragments to read() through a single slot. The reader
// does not take the next fragment off the socket until the previous one
// has been consumed.
class HttplibTransport : public HttpTransport {
public:
    HttplibTransport() = default;
    explicit HttplibTransport(std::chrono::seconds connect_timeout);

    Result<std::unique_ptr<StreamConnection>, Error> open_stream(const HttpRequest& request) override;

private:
    std::chrono::seconds connect_timeout_{30};
};

}  // namespace chatgate::net
