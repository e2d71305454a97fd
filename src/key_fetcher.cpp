#include "authorizer/key_fetcher.hpp"
#include "authorizer/constants.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace authorizer {

namespace {
    struct WriteTarget {
        std::string body;
        bool overflow = false;
    };

    size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* target = static_cast<WriteTarget*>(userdata);
        size_t total = size * nmemb;
        if (target->body.size() + total > MAX_KEY_SET_SIZE) {
            target->overflow = true;
            return 0;  // aborts the transfer
        }
        target->body.append(ptr, total);
        return total;
    }

    void globalInit() {
        static std::once_flag once;
        std::call_once(once, [] {
            CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
            if (res != CURLE_OK) {
                throw FetchError(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(res));
            }
        });
    }
}

CurlKeySetFetcher::CurlKeySetFetcher(std::chrono::seconds timeout) : timeout_(timeout) {
    globalInit();
}

std::string CurlKeySetFetcher::fetch(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw FetchError("Failed to create HTTP handle");
    }

    struct curl_cleanup {
        CURL* handle;
        curl_slist* headers;
        ~curl_cleanup() {
            if (headers) curl_slist_free_all(headers);
            if (handle) curl_easy_cleanup(handle);
        }
    } cleanup{curl, nullptr};

    WriteTarget target;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &target);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

    cleanup.headers = curl_slist_append(cleanup.headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, cleanup.headers);

    spdlog::debug("Fetching key set from '{}'", url);
    CURLcode res = curl_easy_perform(curl);
    if (target.overflow) {
        throw FetchError("Key set response exceeds " + std::to_string(MAX_KEY_SET_SIZE) + " bytes");
    }
    if (res != CURLE_OK) {
        throw FetchError(std::string("Key set request failed: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    spdlog::debug("Key set fetch got status: {}", http_code);
    if (http_code < 200 || http_code >= 300) {
        throw FetchError("Key set request returned HTTP " + std::to_string(http_code));
    }

    return std::move(target.body);
}

}
