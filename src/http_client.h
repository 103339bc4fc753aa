#pragma once

#include <chrono>
#include <string>

struct HttpUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

// Accepts http://host[:port][/path][?query]. Throws ConfigurationError otherwise.
HttpUrl parse_http_url(const std::string& url);

struct HttpResponse {
    int status = 0;
    std::string reason;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpPoster {
public:
    virtual ~HttpPoster() = default;
    // Throws DeliveryError on transport failure or timeout.
    virtual HttpResponse post_json(const HttpUrl& url, const std::string& body,
                                   std::chrono::milliseconds timeout) = 0;
};

// One-shot HTTP/1.1 POST per call (Connection: close) over asio.
class AsioHttpPoster : public HttpPoster {
public:
    HttpResponse post_json(const HttpUrl& url, const std::string& body,
                           std::chrono::milliseconds timeout) override;
};

// Parses "HTTP/1.1 204 No Content". Throws DeliveryError on a malformed line.
HttpResponse parse_status_line(const std::string& line);
