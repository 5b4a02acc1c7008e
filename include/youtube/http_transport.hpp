#pragma once

#include <map>
#include <stdexcept>
#include <string>

struct HttpResult
{
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief Raised when no HTTP response was received (DNS, connect, TLS, timeout)
 */
class HttpTransportError : public std::runtime_error
{
public:
    explicit HttpTransportError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Outbound HTTP(S) used to talk to YouTube.
 *
 * Non-2xx responses are returned, not thrown; only transport failures throw.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult get(const std::string &url, const HttpHeaders &headers) = 0;
    virtual HttpResult post(const std::string &url,
                            const std::string &body,
                            const std::string &content_type,
                            const HttpHeaders &headers) = 0;
};
