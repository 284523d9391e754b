#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include <curl/curl.h>

namespace NewsDesk {

HttpClient::HttpClient()
    : userAgent_("NewsDesk/1.0 (X11; Linux x86_64)"), connectTimeout_(10), receiveTimeout_(10) {
    curl_global_init(CURL_GLOBAL_ALL);
}

HttpClient::~HttpClient() { curl_global_cleanup(); }

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpClient::Response HttpClient::get(const std::string& url) {
    Response response{0, "", false, false, ""};
    CURL* curl = curl_easy_init();
    if (!curl) { response.error = "CURL init failed"; return response; }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connectTimeout_);
    // Below 1 byte/s for receiveTimeout_ seconds counts as a receive timeout
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, receiveTimeout_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
        if (!response.success) {
            LOG_WARN("HTTP {} from {}", response.statusCode, url.substr(0, url.find('?')));
        }
    } else {
        response.timedOut = (res == CURLE_OPERATION_TIMEDOUT);
        response.error = curl_easy_strerror(res);
        LOG_WARN("HTTP request failed: {}", response.error);
    }
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setConnectTimeout(long t) { connectTimeout_ = t; }
void HttpClient::setReceiveTimeout(long t) { receiveTimeout_ = t; }

}
