#include "core/video_id_extractor.hpp"
#include <regex>
#include <vector>

namespace
{
    const std::vector<std::regex> &urlPatterns()
    {
        static const std::vector<std::regex> patterns = {
            std::regex(R"((?:youtube\.com/watch\?v=|youtu\.be/|youtube\.com/embed/)([^&\n?#]+))"),
            std::regex(R"(youtube\.com/watch\?.*v=([^&\n?#]+))"),
        };
        return patterns;
    }
}

std::string VideoIdExtractor::extract(const std::string &url_or_id)
{
    for (const auto &pattern : urlPatterns())
    {
        std::smatch match;
        if (std::regex_search(url_or_id, match, pattern))
            return match.str(1);
    }

    return url_or_id;
}
