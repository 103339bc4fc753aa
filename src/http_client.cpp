#include <chrono>
#include <cctype>
#include <sstream>
#include <string>

#include <asio.hpp>

#include "errors.h"
#include "http_client.h"

HttpUrl parse_http_url(const std::string& url) {
    static const std::string SCHEME = "http://";
    if (url.compare(0, SCHEME.size(), SCHEME) != 0) {
        throw ConfigurationError("Webhook URL must start with http:// (got '" + url + "')");
    }
    const std::string rest = url.substr(SCHEME.size());
    const auto slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);

    HttpUrl out;
    if (slash != std::string::npos) {
        out.target = rest.substr(slash);
        if (out.target.front() == '?') out.target.insert(0, "/");
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        out.port = authority.substr(colon + 1);
        authority.resize(colon);
        if (out.port.empty()) throw ConfigurationError("Webhook URL has an empty port: " + url);
        for (unsigned char c : out.port) {
            if (!std::isdigit(c)) throw ConfigurationError("Webhook URL has an invalid port: " + url);
        }
    }
    if (authority.empty()) throw ConfigurationError("Webhook URL has no host: " + url);
    out.host = authority;
    return out;
}

HttpResponse parse_status_line(const std::string& line) {
    std::istringstream in(line);
    std::string version;
    HttpResponse resp;
    if (!(in >> version >> resp.status) || version.rfind("HTTP/", 0) != 0) {
        throw DeliveryError("Malformed HTTP status line: '" + line + "'");
    }
    std::getline(in, resp.reason);
    while (!resp.reason.empty() && (resp.reason.front() == ' ')) resp.reason.erase(0, 1);
    while (!resp.reason.empty() && (resp.reason.back() == '\r' || resp.reason.back() == '\n')) {
        resp.reason.pop_back();
    }
    return resp;
}

HttpResponse AsioHttpPoster::post_json(const HttpUrl& url, const std::string& body,
                                       std::chrono::milliseconds timeout) {
    using asio::ip::tcp;

    std::ostringstream req;
    req << "POST " << url.target << " HTTP/1.1\r\n"
        << "Host: " << url.host;
    if (url.port != "80") req << ":" << url.port;
    req << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    const std::string request = req.str();

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    std::string response;
    asio::error_code failure;
    const char* failed_stage = "";
    bool done = false;

    auto fail = [&](const char* stage, const asio::error_code& ec) {
        failure = ec;
        done = true;
        failed_stage = stage;
    };

    resolver.async_resolve(url.host, url.port,
        [&](const asio::error_code& ec, tcp::resolver::results_type results) {
            if (ec) return fail("resolve", ec);
            asio::async_connect(socket, results,
                [&](const asio::error_code& ec2, const tcp::endpoint&) {
                    if (ec2) return fail("connect", ec2);
                    asio::async_write(socket, asio::buffer(request),
                        [&](const asio::error_code& ec3, std::size_t) {
                            if (ec3) return fail("write", ec3);
                            asio::async_read_until(socket, asio::dynamic_buffer(response), "\r\n",
                                [&](const asio::error_code& ec4, std::size_t) {
                                    if (ec4) return fail("read", ec4);
                                    done = true;
                                });
                        });
                });
        });

    io.run_for(timeout);

    if (!done) {
        asio::error_code ignored;
        socket.close(ignored);
        throw DeliveryError("POST to " + url.host + " timed out after " +
                            std::to_string(timeout.count()) + " ms");
    }
    if (failure) {
        throw DeliveryError(std::string("POST to ") + url.host + " failed during " +
                            failed_stage + ": " + failure.message());
    }

    asio::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    return parse_status_line(response.substr(0, response.find("\r\n")));
}
