#include "youtube/html_text.hpp"
#include <cctype>
#include <cstdint>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace
{
    const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;
    const size_t MAX_ENTITY_NAME = 32;

    // HTML 4.01 character entities, plus &apos; and the upper-case aliases browsers accept
    const std::unordered_map<std::string, uint32_t> &namedEntities()
    {
        static const std::unordered_map<std::string, uint32_t> entities = {
            {"QUOT", 0x22}, {"quot", 0x22}, {"AMP", 0x26}, {"amp", 0x26}, {"apos", 0x27}, {"LT", 0x3C}, {"lt", 0x3C},
            {"GT", 0x3E}, {"gt", 0x3E}, {"nbsp", 0xA0}, {"iexcl", 0xA1}, {"cent", 0xA2}, {"pound", 0xA3},
            {"curren", 0xA4}, {"yen", 0xA5}, {"brvbar", 0xA6}, {"sect", 0xA7}, {"uml", 0xA8}, {"COPY", 0xA9},
            {"copy", 0xA9}, {"ordf", 0xAA}, {"laquo", 0xAB}, {"not", 0xAC}, {"shy", 0xAD}, {"REG", 0xAE},
            {"reg", 0xAE}, {"macr", 0xAF}, {"deg", 0xB0}, {"plusmn", 0xB1}, {"sup2", 0xB2}, {"sup3", 0xB3},
            {"acute", 0xB4}, {"micro", 0xB5}, {"para", 0xB6}, {"middot", 0xB7}, {"cedil", 0xB8}, {"sup1", 0xB9},
            {"ordm", 0xBA}, {"raquo", 0xBB}, {"frac14", 0xBC}, {"frac12", 0xBD}, {"frac34", 0xBE}, {"iquest", 0xBF},
            {"Agrave", 0xC0}, {"Aacute", 0xC1}, {"Acirc", 0xC2}, {"Atilde", 0xC3}, {"Auml", 0xC4}, {"Aring", 0xC5},
            {"AElig", 0xC6}, {"Ccedil", 0xC7}, {"Egrave", 0xC8}, {"Eacute", 0xC9}, {"Ecirc", 0xCA}, {"Euml", 0xCB},
            {"Igrave", 0xCC}, {"Iacute", 0xCD}, {"Icirc", 0xCE}, {"Iuml", 0xCF}, {"ETH", 0xD0}, {"Ntilde", 0xD1},
            {"Ograve", 0xD2}, {"Oacute", 0xD3}, {"Ocirc", 0xD4}, {"Otilde", 0xD5}, {"Ouml", 0xD6}, {"times", 0xD7},
            {"Oslash", 0xD8}, {"Ugrave", 0xD9}, {"Uacute", 0xDA}, {"Ucirc", 0xDB}, {"Uuml", 0xDC}, {"Yacute", 0xDD},
            {"THORN", 0xDE}, {"szlig", 0xDF}, {"agrave", 0xE0}, {"aacute", 0xE1}, {"acirc", 0xE2}, {"atilde", 0xE3},
            {"auml", 0xE4}, {"aring", 0xE5}, {"aelig", 0xE6}, {"ccedil", 0xE7}, {"egrave", 0xE8}, {"eacute", 0xE9},
            {"ecirc", 0xEA}, {"euml", 0xEB}, {"igrave", 0xEC}, {"iacute", 0xED}, {"icirc", 0xEE}, {"iuml", 0xEF},
            {"eth", 0xF0}, {"ntilde", 0xF1}, {"ograve", 0xF2}, {"oacute", 0xF3}, {"ocirc", 0xF4}, {"otilde", 0xF5},
            {"ouml", 0xF6}, {"divide", 0xF7}, {"oslash", 0xF8}, {"ugrave", 0xF9}, {"uacute", 0xFA}, {"ucirc", 0xFB},
            {"uuml", 0xFC}, {"yacute", 0xFD}, {"thorn", 0xFE}, {"yuml", 0xFF}, {"OElig", 0x152}, {"oelig", 0x153},
            {"Scaron", 0x160}, {"scaron", 0x161}, {"Yuml", 0x178}, {"fnof", 0x192}, {"circ", 0x2C6},
            {"tilde", 0x2DC}, {"Alpha", 0x391}, {"Beta", 0x392}, {"Gamma", 0x393}, {"Delta", 0x394},
            {"Epsilon", 0x395}, {"Zeta", 0x396}, {"Eta", 0x397}, {"Theta", 0x398}, {"Iota", 0x399}, {"Kappa", 0x39A},
            {"Lambda", 0x39B}, {"Mu", 0x39C}, {"Nu", 0x39D}, {"Xi", 0x39E}, {"Omicron", 0x39F}, {"Pi", 0x3A0},
            {"Rho", 0x3A1}, {"Sigma", 0x3A3}, {"Tau", 0x3A4}, {"Upsilon", 0x3A5}, {"Phi", 0x3A6}, {"Chi", 0x3A7},
            {"Psi", 0x3A8}, {"Omega", 0x3A9}, {"alpha", 0x3B1}, {"beta", 0x3B2}, {"gamma", 0x3B3}, {"delta", 0x3B4},
            {"epsilon", 0x3B5}, {"zeta", 0x3B6}, {"eta", 0x3B7}, {"theta", 0x3B8}, {"iota", 0x3B9}, {"kappa", 0x3BA},
            {"lambda", 0x3BB}, {"mu", 0x3BC}, {"nu", 0x3BD}, {"xi", 0x3BE}, {"omicron", 0x3BF}, {"pi", 0x3C0},
            {"rho", 0x3C1}, {"sigmaf", 0x3C2}, {"sigma", 0x3C3}, {"tau", 0x3C4}, {"upsilon", 0x3C5}, {"phi", 0x3C6},
            {"chi", 0x3C7}, {"psi", 0x3C8}, {"omega", 0x3C9}, {"thetasym", 0x3D1}, {"upsih", 0x3D2}, {"piv", 0x3D6},
            {"ensp", 0x2002}, {"emsp", 0x2003}, {"thinsp", 0x2009}, {"zwnj", 0x200C}, {"zwj", 0x200D},
            {"lrm", 0x200E}, {"rlm", 0x200F}, {"ndash", 0x2013}, {"mdash", 0x2014}, {"lsquo", 0x2018},
            {"rsquo", 0x2019}, {"sbquo", 0x201A}, {"ldquo", 0x201C}, {"rdquo", 0x201D}, {"bdquo", 0x201E},
            {"dagger", 0x2020}, {"Dagger", 0x2021}, {"bull", 0x2022}, {"hellip", 0x2026}, {"permil", 0x2030},
            {"prime", 0x2032}, {"Prime", 0x2033}, {"lsaquo", 0x2039}, {"rsaquo", 0x203A}, {"oline", 0x203E},
            {"frasl", 0x2044}, {"euro", 0x20AC}, {"image", 0x2111}, {"weierp", 0x2118}, {"real", 0x211C},
            {"trade", 0x2122}, {"alefsym", 0x2135}, {"larr", 0x2190}, {"uarr", 0x2191}, {"rarr", 0x2192},
            {"darr", 0x2193}, {"harr", 0x2194}, {"crarr", 0x21B5}, {"lArr", 0x21D0}, {"uArr", 0x21D1},
            {"rArr", 0x21D2}, {"dArr", 0x21D3}, {"hArr", 0x21D4}, {"forall", 0x2200}, {"part", 0x2202},
            {"exist", 0x2203}, {"empty", 0x2205}, {"nabla", 0x2207}, {"isin", 0x2208}, {"notin", 0x2209},
            {"ni", 0x220B}, {"prod", 0x220F}, {"sum", 0x2211}, {"minus", 0x2212}, {"lowast", 0x2217},
            {"radic", 0x221A}, {"prop", 0x221D}, {"infin", 0x221E}, {"ang", 0x2220}, {"and", 0x2227}, {"or", 0x2228},
            {"cap", 0x2229}, {"cup", 0x222A}, {"int", 0x222B}, {"there4", 0x2234}, {"sim", 0x223C}, {"cong", 0x2245},
            {"asymp", 0x2248}, {"ne", 0x2260}, {"equiv", 0x2261}, {"le", 0x2264}, {"ge", 0x2265}, {"sub", 0x2282},
            {"sup", 0x2283}, {"nsub", 0x2284}, {"sube", 0x2286}, {"supe", 0x2287}, {"oplus", 0x2295},
            {"otimes", 0x2297}, {"perp", 0x22A5}, {"sdot", 0x22C5}, {"lceil", 0x2308}, {"rceil", 0x2309},
            {"lfloor", 0x230A}, {"rfloor", 0x230B}, {"lang", 0x2329}, {"rang", 0x232A}, {"loz", 0x25CA},
            {"spades", 0x2660}, {"clubs", 0x2663}, {"hearts", 0x2665}, {"diams", 0x2666}};
        return entities;
    }

    // Names that still decode without a trailing ';' ("&amp", "&copy2024")
    const std::unordered_set<std::string> &legacyEntities()
    {
        static const std::unordered_set<std::string> names = {
            "AElig", "AMP", "Aacute", "Acirc", "Agrave", "Aring", "Atilde", "Auml", "COPY", "Ccedil", "ETH",
            "Eacute", "Ecirc", "Egrave", "Euml", "GT", "Iacute", "Icirc", "Igrave", "Iuml", "LT", "Ntilde", "Oacute",
            "Ocirc", "Ograve", "Oslash", "Otilde", "Ouml", "QUOT", "REG", "THORN", "Uacute", "Ucirc", "Ugrave",
            "Uuml", "Yacute", "aacute", "acirc", "acute", "aelig", "agrave", "amp", "aring", "atilde", "auml",
            "brvbar", "ccedil", "cedil", "cent", "copy", "curren", "deg", "divide", "eacute", "ecirc", "egrave",
            "eth", "euml", "frac12", "frac14", "frac34", "gt", "iacute", "icirc", "iexcl", "igrave", "iquest",
            "iuml", "laquo", "lt", "macr", "micro", "middot", "nbsp", "not", "ntilde", "oacute", "ocirc", "ograve",
            "ordf", "ordm", "oslash", "otilde", "ouml", "para", "plusmn", "pound", "quot", "raquo", "reg", "sect",
            "shy", "sup1", "sup2", "sup3", "szlig", "thorn", "times", "uacute", "ucirc", "ugrave", "uml", "uuml",
            "yacute", "yen", "yuml"};
        return names;
    }

    // Numeric references in 0x80-0x9F are read as windows-1252, as browsers do
    uint32_t remapCharref(uint32_t cp)
    {
        static const uint32_t cp1252[32] = {
            0x20AC, 0x81, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
            0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x8D, 0x017D, 0x8F,
            0x90, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
            0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x9D, 0x017E, 0x0178};

        if (cp >= 0x80 && cp <= 0x9F)
            return cp1252[cp - 0x80];
        if (cp == 0)
            return REPLACEMENT_CHARACTER;
        return cp;
    }

    // Control characters and noncharacters that a numeric reference may not produce
    bool isDroppedCodepoint(uint32_t cp)
    {
        if ((cp >= 0x01 && cp <= 0x08) || cp == 0x0B || (cp >= 0x0E && cp <= 0x1F) || (cp >= 0x7F && cp <= 0x9F))
            return true;
        if (cp >= 0xFDD0 && cp <= 0xFDEF)
            return true;
        return (cp & 0xFFFE) == 0xFFFE;
    }

    void appendUtf8(std::string &out, uint32_t cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool isNameChar(char c)
    {
        return c != '\t' && c != '\n' && c != '\f' && c != ' ' && c != '<' && c != '&' && c != '#' && c != ';';
    }

    /**
     * Decodes "&#NNN" or "&#xHHH" starting at amp. The ';' is optional.
     * Returns the position after the reference, or amp when there are no digits.
     */
    size_t decodeNumericReference(const std::string &text, size_t amp, std::string &out)
    {
        size_t pos = amp + 2;
        bool hex = pos < text.size() && (text[pos] == 'x' || text[pos] == 'X');
        if (hex)
            ++pos;

        size_t digits_start = pos;
        uint32_t value = 0;
        bool overflow = false;
        while (pos < text.size() && (hex ? std::isxdigit(static_cast<unsigned char>(text[pos]))
                                         : std::isdigit(static_cast<unsigned char>(text[pos]))))
        {
            char c = text[pos];
            uint32_t digit = std::isdigit(static_cast<unsigned char>(c))
                                 ? static_cast<uint32_t>(c - '0')
                                 : static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
            if (!overflow)
            {
                value = value * (hex ? 16 : 10) + digit;
                overflow = value > 0x10FFFF;
            }
            ++pos;
        }

        if (pos == digits_start)
            return amp;
        if (pos < text.size() && text[pos] == ';')
            ++pos;

        uint32_t cp = overflow ? REPLACEMENT_CHARACTER : remapCharref(value);
        if (cp >= 0xD800 && cp <= 0xDFFF)
            cp = REPLACEMENT_CHARACTER;
        if (!(value >= 0x80 && value <= 0x9F) && isDroppedCodepoint(cp))
            return pos;

        appendUtf8(out, cp);
        return pos;
    }

    /**
     * Decodes "&name;" starting at amp. Without a matching "name;" the longest
     * legacy name prefix is decoded and the rest is kept as text.
     * Returns the position after the consumed characters, or amp when nothing matched.
     */
    size_t decodeNamedReference(const std::string &text, size_t amp, std::string &out)
    {
        size_t pos = amp + 1;
        while (pos < text.size() && pos - amp - 1 < MAX_ENTITY_NAME && isNameChar(text[pos]))
            ++pos;

        std::string name = text.substr(amp + 1, pos - amp - 1);
        if (name.empty())
            return amp;
        bool terminated = pos < text.size() && text[pos] == ';';

        if (terminated)
        {
            auto it = namedEntities().find(name);
            if (it != namedEntities().end())
            {
                appendUtf8(out, it->second);
                return pos + 1;
            }
        }
        else if (legacyEntities().count(name))
        {
            appendUtf8(out, namedEntities().at(name));
            return pos;
        }

        // Longest legacy prefix; "&notit;" reads as "&not" followed by "it;"
        for (size_t length = (terminated ? name.size() : name.size() - 1); length >= 2; --length)
        {
            std::string prefix = name.substr(0, length);
            if (legacyEntities().count(prefix))
            {
                appendUtf8(out, namedEntities().at(prefix));
                return amp + 1 + length;
            }
        }

        return amp;
    }
}

std::string HtmlText::unescape(const std::string &text)
{
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size())
    {
        size_t amp = text.find('&', pos);
        if (amp == std::string::npos)
        {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, amp - pos);

        size_t next = amp;
        if (amp + 1 < text.size() && text[amp + 1] == '#')
            next = decodeNumericReference(text, amp, out);
        else
            next = decodeNamedReference(text, amp, out);

        if (next == amp)
        {
            out += '&';
            pos = amp + 1;
        }
        else
        {
            pos = next;
        }
    }

    return out;
}

std::string HtmlText::stripTags(const std::string &text, bool preserve_formatting)
{
    static const std::regex all_tags("<[^>]*>", std::regex::icase);
    static const std::regex unformatted_tags(
        R"(</?(?!/?(strong|em|b|i|mark|small|del|ins|sub|sup)\b)[^>]*>)", std::regex::icase);

    return std::regex_replace(text, preserve_formatting ? unformatted_tags : all_tags, "");
}

std::string HtmlText::urlEncode(const std::string &value)
{
    static const char *hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : value)
    {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~')
        {
            encoded += static_cast<char>(c);
        }
        else
        {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}
