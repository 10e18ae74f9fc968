#include "tests/support/http_client.hpp"

#include <span>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/core.h>

namespace spindle::testing {

namespace {

constexpr long kTimeoutSec = 120;
constexpr long kConnectTimeoutSec = 5;

}

HttpClient::HttpClient() : handle_(curl_easy_init(), curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept {
    try {
        size_t total_size = size * nmemb;
        std::span<const char> data_view(static_cast<const char*>(ptr), total_size);

        s->append(data_view.begin(), data_view.end());

        return total_size;
    } catch (...) {
        return 0;
    }
}

std::expected<HttpReply, std::string> HttpClient::get(const std::string& url) {
    return request("GET", url);
}

std::expected<HttpReply, std::string> HttpClient::request(const std::string& method,
                                                          const std::string& url) {
    curl_easy_reset(handle_.get());

    HttpReply reply;
    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, kTimeoutSec);
    curl_easy_setopt(handle_.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec);
    curl_easy_setopt(handle_.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_FORBID_REUSE, 1L);

    CURLcode res = curl_easy_perform(handle_.get());
    if (res != CURLE_OK) {
        return std::unexpected(fmt::format("Request failed: {}", curl_easy_strerror(res)));
    }

    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &reply.status);

    char* content_type = nullptr;
    curl_easy_getinfo(handle_.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        reply.content_type = content_type;
    }

    return reply;
}

}  // namespace spindle::testing
