#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "models/Article.hpp"
#include "utils/Config.hpp"

namespace NewsDesk {

class HttpClient;

struct FetchError {
    enum class Kind {
        None,
        Network,
        Timeout,
        Upstream,  // non-2xx status, see status
        Decode
    };
    Kind kind = Kind::None;
    int status = 0;
    std::string message;
};

const char* toString(FetchError::Kind kind);

struct FeedResponse {
    bool success = false;
    std::vector<Article> articles;
    FetchError error;
};

// Client for a NewsAPI-compatible endpoint. Holds no per-request state, so a
// single instance may serve concurrent callers as long as the HttpClient can.
class NewsService {
public:
    NewsService(HttpClient& http, const NewsApiSettings& settings);

    FeedResponse fetchHeadlines(const std::optional<std::string>& category);
    FeedResponse search(const std::string& query);

    // Maps an `articles` payload into records; never throws
    static FeedResponse parseArticles(const std::string& body);

    static std::string buildUrl(const std::string& base,
                                const std::vector<std::pair<std::string, std::string>>& params);

private:
    FeedResponse execute(const std::string& url);

    HttpClient& http_;
    NewsApiSettings settings_;
};

}
