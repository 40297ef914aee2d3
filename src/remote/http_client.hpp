#pragma once

#include <string>
#include <vector>

enum class HttpMethod { Get, Post, Put };

struct HttpResponse {
    long status = 0;            // 0 when the request never got a response
    std::string body;
    std::string error;          // transport error text

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// Blocking HTTP client over one libcurl easy handle. Connections are reused
// between calls. Not thread-safe: one client per thread.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Headers are "Name: value" lines. Transport failures are reported in
    // HttpResponse::error, never thrown.
    HttpResponse request(HttpMethod method, const std::string& url,
                         const std::string& body = "",
                         const std::vector<std::string>& headers = {});

private:
    void* curl_;    // CURL*
};

const char* http_method_name(HttpMethod method);

std::string url_encode(const std::string& s);
