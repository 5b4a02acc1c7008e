#pragma once

#include <string>

class VideoIdExtractor
{
public:
    /**
     * @brief Normalize a video id or YouTube URL into a video id.
     *
     * Recognizes watch (?v=), youtu.be and /embed/ links. The id stops at
     * '&', '?', '#' or a newline. Input that matches none of the shapes is
     * returned unchanged; bad ids only surface when the fetch fails.
     */
    static std::string extract(const std::string &url_or_id);
};
