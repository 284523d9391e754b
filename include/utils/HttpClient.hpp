#pragma once
#include <string>

namespace NewsDesk {

class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    struct Response {
        int statusCode;
        std::string body;
        bool success;     // transfer completed with a 2xx status
        bool timedOut;    // connect or receive timeout hit
        std::string error;
    };

    virtual Response get(const std::string& url);
    void setConnectTimeout(long timeoutSeconds);
    // Longest stall without receiving data before the transfer is abandoned
    void setReceiveTimeout(long timeoutSeconds);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    std::string userAgent_;
    long connectTimeout_;
    long receiveTimeout_;
};

}
