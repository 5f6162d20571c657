#pragma once

#include "stt/error.hpp"
#include "stt/request.hpp"

#include <expected>
#include <stop_token>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool is_success() const { return status >= 200 && status < 300; }
};

// Executes one request and returns the complete response. Implementations
// must not retry and must abandon the exchange once `stop` is requested.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, SttError>
        send(const TranscriptionRequest& request, std::stop_token stop) = 0;
};
