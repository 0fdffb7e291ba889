#include <curl/curl.h>

#include <iostream>

#include "castd/Discovery.hpp"

namespace castd {

CurlDescriptionFetcher::CurlDescriptionFetcher(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {}

std::optional<std::string> CurlDescriptionFetcher::fetch(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) return std::nullopt;

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION,
                     +[](void* contents, size_t size, size_t nmemb, void* userp) -> size_t {
                         static_cast<std::string*>(userp)->append(static_cast<char*>(contents),
                                                                  size * nmemb);
                         return size * nmemb;
                     });

    CURLcode result = curl_easy_perform(curl);
    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    curl_easy_cleanup(curl);

    if (result != CURLE_OK) {
        std::cout << "[Discover] GET " << url << " failed: " << curl_easy_strerror(result) << "\n";
        return std::nullopt;
    }
    if (response_code < 200 || response_code >= 300) {
        std::cout << "[Discover] GET " << url << " -> " << response_code << "\n";
        return std::nullopt;
    }
    return response;
}

}  // namespace castd
