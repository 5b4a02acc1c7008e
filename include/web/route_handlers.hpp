#pragma once

#include "core/transcript_errors.hpp"
#include "core/transcript_models.hpp"
#include "core/transcript_service.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/openapi_docs.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <exception>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * Every error response carries a single {"detail": "..."} body:
 *  - 400: the transcript could not be fetched or listed, whatever the cause
 *  - 422: the request itself is malformed
 *  - 404: unknown path
 *  - 500: unexpected failure inside a handler
 */
class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, TranscriptService &service, std::vector<std::string> default_languages)
    {
        svr.Get("/", [](const httplib::Request &req, httplib::Response &res)
                { handleRoot(req, res); });

        svr.Get("/health", [](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res); });

        svr.Post("/transcript", [&service, default_languages](const httplib::Request &req, httplib::Response &res)
                 { handlePostTranscript(req, res, service, default_languages); });

        svr.Get(R"(/transcript/([^/]+))", [&service, default_languages](const httplib::Request &req, httplib::Response &res)
                { handleGetTranscript(req, res, service, default_languages); });

        svr.Get(R"(/list/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res)
                { handleListTranscripts(req, res, service); });

        svr.Get(ServerConfig::OPENAPI_JSON_PATH, [](const httplib::Request &, httplib::Response &res)
                { res.set_content(OpenApiDocs::getSpec(), "application/json"); });

        svr.Get(ServerConfig::API_DOCS_PATH, [](const httplib::Request &, httplib::Response &res)
                { res.set_content(OpenApiDocs::getSwaggerUI(), "text/html"); });

        // Called for every status >= 400; only fill in responses nobody wrote a body for
        svr.set_error_handler([](const httplib::Request &, httplib::Response &res)
                              {
            if (!res.body.empty())
                return;
            sendError(res, res.status, res.status == 404 ? "Not Found" : "Request failed with status " + std::to_string(res.status)); });

        svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                  {
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception &e)
            {
                Logger::error("Unhandled error in " + req.method + " " + req.path + ": " + e.what());
            }
            catch (...)
            {
                Logger::error("Unhandled non-standard exception in " + req.method + " " + req.path);
            }
            sendError(res, 500, "Internal server error"); });
    }

    static void sendJson(httplib::Response &res, int status, const json &body)
    {
        res.status = status;
        res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    }

    static void sendError(httplib::Response &res, int status, const std::string &detail)
    {
        sendJson(res, status, json{{"detail", detail}});
    }

private:
    static void handleRoot(const httplib::Request &, httplib::Response &res)
    {
        Logger::trace("Received root request");
        sendJson(res, 200, json{{"message", ServerConfig::API_MESSAGE}, {"version", ServerConfig::API_VERSION}});
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res)
    {
        Logger::trace("Received health request");
        sendJson(res, 200, json{{"status", "healthy"}});
    }

    static void handlePostTranscript(const httplib::Request &req, httplib::Response &res,
                                     TranscriptService &service, const std::vector<std::string> &default_languages)
    {
        Logger::trace("Received POST /transcript request");
        try
        {
            json body;
            try
            {
                body = json::parse(req.body);
            }
            catch (const json::parse_error &e)
            {
                throw RequestValidationError(std::string("JSON decode error: ") + e.what());
            }

            auto request = TranscriptRequest::fromJson(body, default_languages);
            respondWithTranscript(res, service, request);
        }
        catch (const RequestValidationError &e)
        {
            Logger::debug("Rejected POST /transcript: " + std::string(e.what()));
            sendError(res, 422, e.what());
        }
    }

    static void handleGetTranscript(const httplib::Request &req, httplib::Response &res,
                                    TranscriptService &service, const std::vector<std::string> &default_languages)
    {
        std::string video_id = req.matches[1];
        Logger::trace("Received GET /transcript/" + video_id + " request");
        try
        {
            auto request = TranscriptRequest::fromQuery(video_id,
                                                        req.get_param_value("languages"),
                                                        req.get_param_value("format"),
                                                        req.get_param_value("preserve_formatting"),
                                                        default_languages);
            respondWithTranscript(res, service, request);
        }
        catch (const RequestValidationError &e)
        {
            Logger::debug("Rejected GET /transcript/" + video_id + ": " + e.what());
            sendError(res, 422, e.what());
        }
    }

    static void handleListTranscripts(const httplib::Request &req, httplib::Response &res, TranscriptService &service)
    {
        std::string video_id = req.matches[1];
        Logger::trace("Received GET /list/" + video_id + " request");
        try
        {
            auto response = service.listTracks(video_id);
            sendJson(res, 200, json(response));
        }
        catch (const TranscriptRequestError &e)
        {
            sendError(res, 400, e.what());
        }
    }

    static void respondWithTranscript(httplib::Response &res, TranscriptService &service, const TranscriptRequest &request)
    {
        try
        {
            auto response = service.fetch(request);
            sendJson(res, 200, json(response));
        }
        catch (const TranscriptRequestError &e)
        {
            sendError(res, 400, e.what());
        }
    }
};
