#pragma once
#include <string>

namespace NewsDesk {

struct Article {
    std::string title;
    std::string description;
    std::string url;          // identity, bookmark key
    std::string imageUrl;
    std::string publishedAt;  // ISO-8601
    std::string source;

    // First 10 characters of publishedAt (the date part), or all of it when shorter
    std::string displayDate() const {
        return publishedAt.substr(0, 10);
    }
};

inline bool operator==(const Article& a, const Article& b) {
    return a.title == b.title && a.description == b.description && a.url == b.url &&
           a.imageUrl == b.imageUrl && a.publishedAt == b.publishedAt && a.source == b.source;
}

inline bool operator!=(const Article& a, const Article& b) { return !(a == b); }

}
