#include "curl_transport.hpp"

#include <curl/curl.h>
#include <memory>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
    void operator()(curl_mime* m) const { curl_mime_free(m); }
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using MimePtr = std::unique_ptr<curl_mime, CurlDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, CurlDeleter>;

std::expected<MimePtr, SttError> build_mime(CURL* curl, const TranscriptionRequest& request) {
    MimePtr mime(curl_mime_init(curl));
    if (!mime) {
        return std::unexpected(SttError::request_build("curl_mime_init failed"));
    }

    for (auto& p : request.parts) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        if (!part) {
            return std::unexpected(SttError::request_build("curl_mime_addpart failed"));
        }

        CURLcode rc = curl_mime_name(part, p.name.c_str());
        if (rc == CURLE_OK) rc = curl_mime_data(part, p.data.data(), p.data.size());
        if (rc == CURLE_OK && p.is_file()) rc = curl_mime_filename(part, p.filename.c_str());
        if (rc == CURLE_OK && !p.content_type.empty()) {
            rc = curl_mime_type(part, p.content_type.c_str());
        }
        if (rc != CURLE_OK) {
            return std::unexpected(SttError::request_build(
                "part '" + p.name + "': " + curl_easy_strerror(rc)));
        }
    }
    return mime;
}

} // namespace

CurlTransport::CurlTransport(long connect_timeout_s, long timeout_s)
    : connect_timeout_s_(connect_timeout_s), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

std::expected<HttpResponse, SttError>
CurlTransport::send(const TranscriptionRequest& request, std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(SttError::cancelled());
    }

    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(SttError::network("curl_easy_init failed"));
    }

    auto mime = build_mime(curl.get(), request);
    if (!mime) {
        return std::unexpected(mime.error());
    }

    curl_slist* header_list = nullptr;
    for (auto& [key, value] : request.headers) {
        std::string line = key + ": " + value;
        curl_slist* next = curl_slist_append(header_list, line.c_str());
        if (!next) {
            curl_slist_free_all(header_list);
            return std::unexpected(SttError::request_build("curl_slist_append failed"));
        }
        header_list = next;
    }
    SlistPtr headers(header_list);

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime->get());
    if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (connect_timeout_s_ > 0) curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_s_);
    if (timeout_s_ > 0) curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_s_);

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_ABORTED_BY_CALLBACK || stop.stop_requested()) {
        return std::unexpected(SttError::cancelled());
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (res != CURLE_OK) {
        // A status line means the server answered and the body broke off.
        if (response.status != 0) {
            return std::unexpected(SttError::response_read(curl_easy_strerror(res)));
        }
        return std::unexpected(SttError::network(curl_easy_strerror(res)));
    }

    return response;
}
