#pragma once
#include <chrono>
#include <regex>
#include <stdexcept>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "../weather/iupstream.hpp"

/**
 * @brief RAII wrapper for curl_global_init / curl_global_cleanup
 *
 * Create exactly one in main() before any worker thread starts.
 */
struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * @brief Turn an HTTP reply from the station into an UpstreamResponse
 *
 * - non-JSON content type: UPSTREAM_ERROR, the raw body is the message
 * - body that does not parse: UPSTREAM_ERROR
 * - status >= 400: UPSTREAM_ERROR; the error document is tagged with
 *   "messagesource": "weatherstation" and its "message" is reported
 * - anything else: OK with the parsed document
 */
inline UpstreamResponse classify_response(long status, const std::string& content_type,
                                          const std::string& body) {
    UpstreamResponse r;
    r.status = status;

    static const std::regex json_type("^application/json", std::regex::icase);
    if (!std::regex_search(content_type, json_type)) {
        r.error = FetchError::UPSTREAM_ERROR;
        r.body = {{"message", body}, {"messagesource", "weatherstation"}};
        r.message = body.empty() ? "non-JSON reply (" + content_type + ")" : body;
        return r;
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        r.error = FetchError::UPSTREAM_ERROR;
        r.message = "malformed JSON from weather station";
        return r;
    }

    if (status >= 400) {
        r.error = FetchError::UPSTREAM_ERROR;
        if (parsed.is_object()) {
            parsed["messagesource"] = "weatherstation";
            if (parsed.contains("message") && parsed["message"].is_string()) {
                r.message = parsed["message"].get<std::string>();
            }
        }
        if (r.message.empty()) {
            r.message = "HTTP status " + std::to_string(status);
        }
        r.body = std::move(parsed);
        return r;
    }

    r.body = std::move(parsed);
    return r;
}

/**
 * @brief Classify a completed transfer, given the result of reading its info
 *
 * A reply whose status or content type could not be read is a transport
 * failure, never a success with status 0.
 */
inline UpstreamResponse classify_transfer(CURLcode info_rc, long status,
                                          const std::string& content_type,
                                          const std::string& body) {
    if (info_rc != CURLE_OK) {
        UpstreamResponse r;
        r.error = FetchError::TRANSPORT_ERROR;
        r.message = std::string("cannot read reply info: ") + curl_easy_strerror(info_rc);
        return r;
    }
    return classify_response(status, content_type, body);
}

/**
 * @brief Weather station document source over HTTP (libcurl easy API)
 *
 * One easy handle per request; the station is polled at most every few
 * seconds so connection reuse is not worth the shared-handle locking.
 */
class HttpUpstream : public IUpstream {
private:
    std::string url_;
    std::chrono::milliseconds timeout_;

    static size_t write_cb(char* contents, size_t size, size_t nmemb, void* userp) {
        auto* out = static_cast<std::string*>(userp);
        out->append(contents, size * nmemb);
        return size * nmemb;
    }

public:
    /**
     * @brief Constructor
     * @param url Station document URL
     * @param timeout Upper bound for the whole request
     */
    HttpUpstream(std::string url, std::chrono::milliseconds timeout)
        : url_(std::move(url)), timeout_(timeout) {}

    UpstreamResponse fetch() override {
        UpstreamResponse r;

        CURL* c = curl_easy_init();
        if (!c) {
            r.error = FetchError::TRANSPORT_ERROR;
            r.message = "curl_easy_init failed";
            return r;
        }

        std::string body;
        curl_easy_setopt(c, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&body));
        curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
        curl_easy_setopt(c, CURLOPT_FAILONERROR, 0L);  // keep 4xx/5xx bodies
        curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(c);
        if (res != CURLE_OK) {
            r.error = FetchError::TRANSPORT_ERROR;
            r.message = curl_easy_strerror(res);
            curl_easy_cleanup(c);
            return r;
        }

        long http_code = 0;
        char* ctype = nullptr;
        CURLcode info_rc = curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &http_code);
        if (info_rc == CURLE_OK) {
            info_rc = curl_easy_getinfo(c, CURLINFO_CONTENT_TYPE, &ctype);
        }
        std::string content_type = ctype ? ctype : "";
        curl_easy_cleanup(c);

        return classify_transfer(info_rc, http_code, content_type, body);
    }

    const std::string& get_url() const { return url_; }
};
