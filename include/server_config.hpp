#pragma once

class ServerConfig
{
public:
    static constexpr const char *API_TITLE = "YouTube Transcript API";
    static constexpr const char *API_MESSAGE = "YouTube Transcript API Server";
    static constexpr const char *API_VERSION = "1.0.0";
    static constexpr const char *API_DOCS_PATH = "/docs";
    static constexpr const char *OPENAPI_JSON_PATH = "/openapi.json";
    static constexpr const char *DEFAULT_CONFIG_PATH = "config/config.json";
};
