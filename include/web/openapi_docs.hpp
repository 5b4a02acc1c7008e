#pragma once

#include <string>
#include "server_config.hpp"

class OpenApiDocs
{
public:
  static const std::string &getSpec()
  {
    static const std::string spec = R"({
  "openapi": "3.0.0",
  "info": {
    "title": ")" + std::string(ServerConfig::API_TITLE) + R"(",
    "version": ")" + std::string(ServerConfig::API_VERSION) + R"(",
    "description": "Extracts caption/transcript tracks from YouTube videos by URL or video id. Supports language preference lists, JSON or plain text output, and listing of available tracks.",
    "license": {
      "name": "MIT License",
      "url": "https://opensource.org/licenses/MIT"
    }
  },
  "tags": [
    {"name": "basic"},
    {"name": "transcripts"}
  ],
  "paths": {
    "/": {
      "get": {
        "tags": ["basic"],
        "summary": "API information",
        "responses": {
          "200": {
            "description": "Server name and version",
            "content": {"application/json": {"schema": {"$ref": "#/components/schemas/RootResponse"}}}
          }
        }
      }
    },
    "/health": {
      "get": {
        "tags": ["basic"],
        "summary": "Health check",
        "responses": {
          "200": {
            "description": "Server is healthy",
            "content": {"application/json": {"schema": {"$ref": "#/components/schemas/HealthResponse"}}}
          }
        }
      }
    },
    "/transcript": {
      "post": {
        "tags": ["transcripts"],
        "summary": "Fetch a transcript with a JSON body",
        "requestBody": {
          "required": true,
          "content": {"application/json": {"schema": {"$ref": "#/components/schemas/TranscriptRequest"}}}
        },
        "responses": {
          "200": {
            "description": "Transcript of the first requested language that has a track",
            "content": {"application/json": {"schema": {"$ref": "#/components/schemas/TranscriptResponse"}}}
          },
          "400": {"$ref": "#/components/responses/RequestFailed"},
          "422": {"$ref": "#/components/responses/ValidationFailed"}
        }
      }
    },
    "/transcript/{video_id}": {
      "get": {
        "tags": ["transcripts"],
        "summary": "Fetch a transcript with query parameters",
        "parameters": [
          {"name": "video_id", "in": "path", "required": true, "schema": {"type": "string"}, "example": "dQw4w9WgXcQ"},
          {"name": "languages", "in": "query", "description": "Comma-separated language codes in priority order", "schema": {"type": "string", "default": "ko,en"}},
          {"name": "format", "in": "query", "schema": {"type": "string", "enum": ["json", "text"], "default": "json"}},
          {"name": "preserve_formatting", "in": "query", "description": "Keep HTML formatting tags such as <i> and <b>", "schema": {"type": "boolean", "default": false}}
        ],
        "responses": {
          "200": {
            "description": "Transcript of the first requested language that has a track",
            "content": {"application/json": {"schema": {"$ref": "#/components/schemas/TranscriptResponse"}}}
          },
          "400": {"$ref": "#/components/responses/RequestFailed"},
          "422": {"$ref": "#/components/responses/ValidationFailed"}
        }
      }
    },
    "/list/{video_id}": {
      "get": {
        "tags": ["transcripts"],
        "summary": "List available transcripts",
        "parameters": [
          {"name": "video_id", "in": "path", "required": true, "schema": {"type": "string"}, "example": "dQw4w9WgXcQ"}
        ],
        "responses": {
          "200": {
            "description": "Every track of the video, manually created first",
            "content": {"application/json": {"schema": {"$ref": "#/components/schemas/TranscriptListResponse"}}}
          },
          "400": {"$ref": "#/components/responses/RequestFailed"}
        }
      }
    }
  },
  "components": {
    "responses": {
      "RequestFailed": {
        "description": "The transcript could not be retrieved: video not found, language unavailable, subtitles disabled or network failure",
        "content": {"application/json": {"schema": {"$ref": "#/components/schemas/ErrorResponse"}}}
      },
      "ValidationFailed": {
        "description": "The request is malformed",
        "content": {"application/json": {"schema": {"$ref": "#/components/schemas/ErrorResponse"}}}
      }
    },
    "schemas": {
      "TranscriptRequest": {
        "type": "object",
        "required": ["url_or_id"],
        "properties": {
          "url_or_id": {"type": "string", "example": "https://www.youtube.com/watch?v=dQw4w9WgXcQ"},
          "languages": {"type": "array", "items": {"type": "string"}, "default": ["ko", "en"]},
          "format": {"type": "string", "enum": ["json", "text"], "default": "json"},
          "preserve_formatting": {"type": "boolean", "default": false}
        }
      },
      "TranscriptSegment": {
        "type": "object",
        "properties": {
          "text": {"type": "string"},
          "start": {"type": "number"},
          "duration": {"type": "number"}
        }
      },
      "TranscriptResponse": {
        "type": "object",
        "properties": {
          "video_id": {"type": "string"},
          "language": {"type": "string", "example": "Korean"},
          "language_code": {"type": "string", "example": "ko"},
          "is_generated": {"type": "boolean"},
          "transcript": {
            "oneOf": [
              {"type": "string"},
              {"type": "array", "items": {"$ref": "#/components/schemas/TranscriptSegment"}}
            ]
          }
        }
      },
      "TranscriptInfo": {
        "type": "object",
        "properties": {
          "language": {"type": "string"},
          "language_code": {"type": "string"},
          "is_generated": {"type": "boolean"},
          "is_translatable": {"type": "boolean"},
          "translation_languages": {"type": "array", "items": {"type": "string"}}
        }
      },
      "TranscriptListResponse": {
        "type": "object",
        "properties": {
          "video_id": {"type": "string"},
          "available_transcripts": {"type": "array", "items": {"$ref": "#/components/schemas/TranscriptInfo"}}
        }
      },
      "ErrorResponse": {
        "type": "object",
        "properties": {"detail": {"type": "string"}}
      },
      "HealthResponse": {
        "type": "object",
        "properties": {"status": {"type": "string", "example": "healthy"}}
      },
      "RootResponse": {
        "type": "object",
        "properties": {
          "message": {"type": "string"},
          "version": {"type": "string"}
        }
      }
    }
  }
})";
    return spec;
  }

  static std::string getSwaggerUI()
  {
    return R"(
            <!DOCTYPE html>
            <html>
            <head>
                <title>)" +
           std::string(ServerConfig::API_TITLE) + R"( - Swagger UI</title>
                <link rel="stylesheet" type="text/css" href="https://unpkg.com/swagger-ui-dist@5/swagger-ui.css">
                <script src="https://unpkg.com/swagger-ui-dist@5/swagger-ui-bundle.js"></script>
            </head>
            <body>
                <div id="swagger-ui"></div>
                <script>
                    window.onload = function() {
                        SwaggerUIBundle({
                            url: ")" +
           std::string(ServerConfig::OPENAPI_JSON_PATH) + R"(",
                            dom_id: '#swagger-ui',
                            deepLinking: true,
                            presets: [
                                SwaggerUIBundle.presets.apis,
                                SwaggerUIBundle.SwaggerUIStandalonePreset
                            ],
                        });
                    };
                </script>
            </body>
            </html>
        )";
  }
};
