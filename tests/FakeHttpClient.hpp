#pragma once
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"

namespace NewsDesk {

// Answers requests from canned responses, matched by URL substring in
// registration order; unmatched URLs fail like an unreachable host.
class FakeHttpClient : public HttpClient {
public:
    void respond(const std::string& urlPart, const Response& response) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.emplace_back(urlPart, response);
    }

    void respondJson(const std::string& urlPart, int status, const std::string& body) {
        respond(urlPart, Response{status, body, status >= 200 && status < 300, false, ""});
    }

    Response get(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.push_back(url);
        for (const auto& route : routes_) {
            if (url.find(route.first) != std::string::npos) return route.second;
        }
        return Response{0, "", false, false, "Couldn't resolve host name"};
    }

    std::vector<std::string> requested() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

private:
    std::mutex mutex_;
    std::vector<std::pair<std::string, Response>> routes_;
    std::vector<std::string> requested_;
};

inline NewsApiSettings testSettings() {
    NewsApiSettings settings;
    settings.baseUrl = "https://news.test/v2";
    settings.apiKey = "test-key";
    settings.country = "us";
    return settings;
}

}
