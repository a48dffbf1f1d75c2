// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/core/http_session.hpp>
#include <hlsgrab/disk/file_writer.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace hlsgrab::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct CurlHeaders {
    curl_slist* ptr = nullptr;

    CurlHeaders() = default;
    ~CurlHeaders() { if (ptr) curl_slist_free_all(ptr); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const std::string& line) noexcept {
        if (auto* next = curl_slist_append(ptr, line.c_str())) {
            ptr = next;
        }
    }
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    // Redirect hops send their own headers; keep the last value
    (*headers)[lower_name] = std::string(value);
    return total;
}

// Write callback for in-memory bodies
std::size_t string_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    try {
        body->append(ptr, total);
    } catch (const std::bad_alloc&) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

// Write callback for file downloads
std::size_t file_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* writer = static_cast<disk::FileWriter*>(userdata);
    std::size_t total = size * nitems;
    if (writer->write(ptr, total)) {
        return 0;
    }
    return total;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransportErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(TransportErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(TransportErrc::refused);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(TransportErrc::invalid_url);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TransportErrc::too_many_redirects);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(TransportErrc::ssl_error);
        case CURLE_WRITE_ERROR:
            return make_error_code(TransportErrc::write_failed);
        default:
            return make_error_code(TransportErrc::network_error);
    }
}

// Options shared by every request
void apply_common_options(CURL* curl, const std::string& url, const TransportConfig& config,
                          CurlHeaders& headers, HttpResponse& response) noexcept {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(config.max_redirects));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_tls ? 2L : 0L);

    if (!config.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
    }
    for (const auto& [name, value] : config.headers) {
        headers.append(name + ": " + value);
    }
    if (headers.ptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
}

// Fill status, type, length and effective URL after a transfer
std::error_code finish_response(CURL* curl, CURLcode result, HttpResponse& response) noexcept {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    char* ct = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }

    curl_off_t cl = 0;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl > 0) {
        response.content_length = static_cast<std::uint64_t>(cl);
    }

    char* effective = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    }

    if (result != CURLE_OK) {
        return curl_to_error(result);
    }
    return status_to_error(http_code);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(TransportConfig config)
    : config_(std::move(config)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransportErrc::network_error));
    }

    HttpResponse response{};
    CurlHeaders headers;
    apply_common_options(curl.ptr, url, config_, headers, response);

    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(config_.transfer_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, string_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = finish_response(curl.ptr, result, response)) {
        return std::unexpected(ec);
    }
    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::download(const std::string& url, const std::filesystem::path& path) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransportErrc::network_error));
    }

    disk::FileWriter writer;
    if (auto ec = writer.open(path)) {
        return std::unexpected(ec);
    }

    HttpResponse response{};
    CurlHeaders headers;
    apply_common_options(curl.ptr, url, config_, headers, response);

    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(config_.transfer_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, file_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &writer);

    CURLcode result = curl_easy_perform(curl.ptr);
    auto close_ec = writer.close();

    if (auto ec = finish_response(curl.ptr, result, response)) {
        return std::unexpected(ec);
    }
    if (close_ec) {
        return std::unexpected(close_ec);
    }
    if (response.content_length == 0) {
        response.content_length = writer.bytes_written();
    }
    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransportErrc::network_error));
    }

    HttpResponse response{};
    CurlHeaders headers;
    apply_common_options(curl.ptr, url, config_, headers, response);

    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(config_.probe_timeout_sec));

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = finish_response(curl.ptr, result, response)) {
        return std::unexpected(ec);
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is unreliable for HEAD
    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(it->second.c_str(), &end, 10);
        if (end == it->second.c_str() + it->second.size()) {
            response.content_length = static_cast<std::uint64_t>(val);
        }
    }
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace hlsgrab::core
