#pragma once

#include "youtube/http_transport.hpp"
#include <string>
#include <utility>

struct TransportSettings
{
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 30;
    std::string user_agent;
    std::string proxy_host; // empty: no proxy
    int proxy_port = 0;
};

/**
 * @brief HttpTransport over httplib::Client (HTTPS through OpenSSL).
 *
 * Redirects are followed. A client is built per call from the scheme and
 * host of the URL.
 */
class HttplibTransport : public HttpTransport
{
public:
    explicit HttplibTransport(TransportSettings settings) : settings_(std::move(settings)) {}

    HttpResult get(const std::string &url, const HttpHeaders &headers) override;
    HttpResult post(const std::string &url,
                    const std::string &body,
                    const std::string &content_type,
                    const HttpHeaders &headers) override;

    /**
     * @brief Split "https://host[:port]/path?query" into {"https://host[:port]", "/path?query"}
     * @throws HttpTransportError when the URL has no scheme
     */
    static std::pair<std::string, std::string> splitUrl(const std::string &url);

private:
    TransportSettings settings_;
};
