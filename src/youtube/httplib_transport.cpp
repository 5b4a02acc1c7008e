#include "youtube/httplib_transport.hpp"
#include "logging/logger.hpp"
#include <httplib.h>

namespace
{
    httplib::Headers toHttplibHeaders(const HttpHeaders &headers, const std::string &user_agent)
    {
        httplib::Headers converted;
        if (!user_agent.empty() && headers.find("User-Agent") == headers.end())
            converted.emplace("User-Agent", user_agent);
        for (const auto &header : headers)
            converted.emplace(header.first, header.second);
        return converted;
    }

    void configureClient(httplib::Client &client, const TransportSettings &settings)
    {
        client.set_follow_location(true);
        client.set_connection_timeout(settings.connect_timeout_seconds, 0);
        client.set_read_timeout(settings.read_timeout_seconds, 0);
        client.set_write_timeout(settings.read_timeout_seconds, 0);
        if (!settings.proxy_host.empty())
            client.set_proxy(settings.proxy_host, settings.proxy_port);
    }

    HttpResult toResult(const httplib::Result &result, const std::string &method, const std::string &url)
    {
        if (!result)
        {
            throw HttpTransportError(method + " " + url + " failed: " + httplib::to_string(result.error()));
        }

        Logger::trace(method + " " + url + " -> " + std::to_string(result->status));
        return HttpResult{result->status, result->body};
    }
}

std::pair<std::string, std::string> HttplibTransport::splitUrl(const std::string &url)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw HttpTransportError("URL has no scheme: " + url);

    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos)
        return {url, "/"};
    return {url.substr(0, path_start), url.substr(path_start)};
}

HttpResult HttplibTransport::get(const std::string &url, const HttpHeaders &headers)
{
    auto parts = splitUrl(url);
    httplib::Client client(parts.first);
    configureClient(client, settings_);

    auto result = client.Get(parts.second, toHttplibHeaders(headers, settings_.user_agent));
    return toResult(result, "GET", url);
}

HttpResult HttplibTransport::post(const std::string &url,
                                  const std::string &body,
                                  const std::string &content_type,
                                  const HttpHeaders &headers)
{
    auto parts = splitUrl(url);
    httplib::Client client(parts.first);
    configureClient(client, settings_);

    auto result = client.Post(parts.second, toHttplibHeaders(headers, settings_.user_agent), body, content_type);
    return toResult(result, "POST", url);
}
