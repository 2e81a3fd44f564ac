#include "util/ColorSpec.hpp"
#include "util/PipelineError.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace squarify::util {

namespace
{
    struct NamedColor { const char* name; int r, g, b; };

    // CSS values, so "green" is the half-intensity one
    const NamedColor kNamedColors[] = {
        { "white",   255, 255, 255 },
        { "black",     0,   0,   0 },
        { "red",     255,   0,   0 },
        { "lime",      0, 255,   0 },
        { "green",     0, 128,   0 },
        { "blue",      0,   0, 255 },
        { "yellow",  255, 255,   0 },
        { "cyan",      0, 255, 255 },
        { "magenta", 255,   0, 255 },
        { "gray",    128, 128, 128 },
        { "grey",    128, 128, 128 },
        { "silver",  192, 192, 192 },
    };

    [[noreturn]] void badColor(const std::string& text)
    {
        throw PipelineError(ErrorKind::InvalidParameter, "malformed color specification: \"" + text + "\"");
    }

    std::string trimLower(const std::string& s)
    {
        auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        std::string out = (b < e) ? std::string(b, e) : std::string();
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    int hexDigit(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }

    bool parseHexDigits(const std::string& digits, Rgb& out)
    {
        if (!std::all_of(digits.begin(), digits.end(), [](char c) { return hexDigit(c) >= 0; })) return false;
        if (digits.size() == 6)
        {
            out = Rgb(hexDigit(digits[0]) * 16 + hexDigit(digits[1]),
                      hexDigit(digits[2]) * 16 + hexDigit(digits[3]),
                      hexDigit(digits[4]) * 16 + hexDigit(digits[5]));
            return true;
        }
        if (digits.size() == 3)
        {
            // #abc == #aabbcc
            out = Rgb(hexDigit(digits[0]) * 17, hexDigit(digits[1]) * 17, hexDigit(digits[2]) * 17);
            return true;
        }
        return false;
    }

    void skipSpace(const std::string& s, std::size_t& i)
    {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool expect(const std::string& s, std::size_t& i, char c)
    {
        skipSpace(s, i);
        if (i >= s.size() || s[i] != c) return false;
        ++i;
        return true;
    }

    // 1-3 decimal digits; longer runs cannot be a channel value
    bool parseComponent(const std::string& s, std::size_t& i, int& v)
    {
        skipSpace(s, i);
        std::size_t start = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == start || i - start > 3) return false;
        v = std::stoi(s.substr(start, i - start));
        return v <= 255;
    }

    // "rgb(r, g, b)", already lowercased and trimmed
    bool parseRgbFunction(const std::string& s, Rgb& out)
    {
        std::size_t i = 3;
        int r = 0, g = 0, b = 0;
        if (!expect(s, i, '(') || !parseComponent(s, i, r) || !expect(s, i, ',') ||
            !parseComponent(s, i, g) || !expect(s, i, ',') || !parseComponent(s, i, b) || !expect(s, i, ')'))
            return false;
        if (i != s.size()) return false;
        out = Rgb(r, g, b);
        return true;
    }
}

Rgb parseColor(const std::string& text)
{
    const std::string s = trimLower(text);
    if (s.empty()) badColor(text);

    Rgb c;
    if (s[0] == '#')
    {
        if (parseHexDigits(s.substr(1), c)) return c;
        badColor(text);
    }
    if (s.compare(0, 3, "rgb") == 0)
    {
        if (parseRgbFunction(s, c)) return c;
        badColor(text);
    }
    for (const auto& named : kNamedColors)
        if (s == named.name) return Rgb(named.r, named.g, named.b);
    if (s.size() == 6 && parseHexDigits(s, c)) return c;
    badColor(text);
}

std::string toHex(const Rgb& c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r & 0xff, c.g & 0xff, c.b & 0xff);
    return std::string(buf);
}

bool isValid(const Rgb& c)
{
    auto inRange = [](int v) { return v >= 0 && v <= 255; };
    return inRange(c.r) && inRange(c.g) && inRange(c.b);
}

}
