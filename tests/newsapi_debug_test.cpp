#include <iostream>
#include <cstdlib>
#include "services/NewsService.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"

int main(int argc, char* argv[]) {
    const char* key = std::getenv("NEWSDESK_API_KEY");
    if (!key || !*key) {
        std::cout << "NEWSDESK_API_KEY not set, skipping live request\n";
        return 0;
    }

    NewsDesk::NewsApiSettings settings;
    settings.apiKey = key;
    NewsDesk::HttpClient http;
    NewsDesk::NewsService svc(http, settings);

    std::string category = argc > 1 ? argv[1] : "technology";
    std::cout << "Fetching top headlines: " << category << "\n";

    auto result = svc.fetchHeadlines(category);
    if (!result.success) {
        std::cout << "Request failed (" << NewsDesk::toString(result.error.kind) << "): "
                  << result.error.message << "\n";
        return 0;
    }

    std::cout << "Received " << result.articles.size() << " articles\n";
    for (size_t i = 0; i < result.articles.size() && i < 20; ++i) {
        const auto& a = result.articles[i];
        std::cout << i + 1 << ". " << (a.title.empty() ? "(no title)" : a.title) << "\n";
        std::cout << "   Link: " << a.url << "\n";
        std::cout << "   Image: " << (a.imageUrl.empty() ? "(none)" : a.imageUrl) << "\n";
        std::cout << "   Source: " << a.source << " " << a.displayDate() << "\n";
    }
    return 0;
}
