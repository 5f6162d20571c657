#pragma once

#include "http_transport.hpp"

// libcurl transport. Every send() uses its own easy handle, so one instance
// can serve concurrent transcriptions.
class CurlTransport : public HttpTransport {
public:
    // Timeouts in seconds; 0 leaves the transfer unbounded.
    explicit CurlTransport(long connect_timeout_s = 0, long timeout_s = 0);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, SttError>
        send(const TranscriptionRequest& request, std::stop_token stop) override;

private:
    long connect_timeout_s_;
    long timeout_s_;
};
