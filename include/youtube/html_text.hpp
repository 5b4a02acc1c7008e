#pragma once

#include <string>

class HtmlText
{
public:
    // Decodes named (&amp;, &euro;, ...) and numeric (&#39;, &#x27;) references to UTF-8,
    // with the same rules browsers apply: legacy names decode without ';', and
    // &#128;..&#159; are read as windows-1252. Unknown references are left as-is.
    static std::string unescape(const std::string &text);

    /**
     * @brief Removes markup tags from caption text.
     * @param preserve_formatting Keep strong, em, b, i, mark, small, del, ins, sub and sup tags
     */
    static std::string stripTags(const std::string &text, bool preserve_formatting);

    // Percent-encodes everything outside the URL unreserved set
    static std::string urlEncode(const std::string &value);
};
