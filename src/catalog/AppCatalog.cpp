#include "ecp/catalog/AppCatalog.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <utility>

namespace ecp::catalog {

namespace {

constexpr std::string_view kOpenTag = "<app";
constexpr std::string_view kCloseTag = "</app>";
constexpr std::size_t kMaxEntityLength = 32;

struct NamedEntity {
    std::string_view name;
    std::uint32_t codePoint;
};

constexpr std::array<NamedEntity, 46> kNamedEntities{{
    {"amp", 0x26},    {"lt", 0x3C},     {"gt", 0x3E},     {"quot", 0x22},
    {"apos", 0x27},   {"nbsp", 0xA0},   {"iexcl", 0xA1},  {"cent", 0xA2},
    {"pound", 0xA3},  {"yen", 0xA5},    {"sect", 0xA7},   {"copy", 0xA9},
    {"laquo", 0xAB},  {"reg", 0xAE},    {"deg", 0xB0},    {"plusmn", 0xB1},
    {"para", 0xB6},   {"middot", 0xB7}, {"raquo", 0xBB},  {"iquest", 0xBF},
    {"Agrave", 0xC0}, {"Aacute", 0xC1}, {"Auml", 0xC4},   {"Ccedil", 0xC7},
    {"Eacute", 0xC9}, {"Ntilde", 0xD1}, {"Ouml", 0xD6},   {"times", 0xD7},
    {"Uuml", 0xDC},   {"szlig", 0xDF},  {"agrave", 0xE0}, {"aacute", 0xE1},
    {"auml", 0xE4},   {"ccedil", 0xE7}, {"egrave", 0xE8}, {"eacute", 0xE9},
    {"ntilde", 0xF1}, {"ouml", 0xF6},   {"divide", 0xF7}, {"uuml", 0xFC},
    {"ndash", 0x2013},{"mdash", 0x2014},{"rsquo", 0x2019},{"ldquo", 0x201C},
    {"rdquo", 0x201D},{"trade", 0x2122},
}};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::optional<std::uint32_t> numericReference(std::string_view body) {
    // body is what follows '#', e.g. "38" or "x26"
    int base = 10;
    if (!body.empty() && (body.front() == 'x' || body.front() == 'X')) {
        base = 16;
        body.remove_prefix(1);
    }
    if (body.empty() || body.size() > 8) {
        return std::nullopt;
    }

    std::uint32_t value = 0;
    for (char c : body) {
        int digit = -1;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (base == 16 && c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (base == 16 && c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        if (digit < 0) return std::nullopt;
        value = value * static_cast<std::uint32_t>(base) + static_cast<std::uint32_t>(digit);
    }

    if (value == 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint32_t> namedReference(std::string_view name) {
    for (const auto& entity : kNamedEntities) {
        if (entity.name == name) {
            return entity.codePoint;
        }
    }
    return std::nullopt;
}

// Value of the `id` attribute inside a start tag's attribute text.
std::optional<std::string_view> idAttribute(std::string_view attributes) {
    constexpr std::string_view key = "id=\"";
    std::size_t pos = 0;
    while ((pos = attributes.find(key, pos)) != std::string_view::npos) {
        if (pos > 0 && isSpace(attributes[pos - 1])) {
            const auto valueStart = pos + key.size();
            const auto valueEnd = attributes.find('"', valueStart);
            if (valueEnd == std::string_view::npos) {
                return std::nullopt;
            }
            return attributes.substr(valueStart, valueEnd - valueStart);
        }
        pos += key.size();
    }
    return std::nullopt;
}

} // namespace

std::vector<AppEntry> parseAppCatalog(std::string_view document) {
    std::vector<AppEntry> apps;
    std::unordered_set<std::string> seen;

    std::size_t pos = 0;
    while ((pos = document.find(kOpenTag, pos)) != std::string_view::npos) {
        const std::size_t nameEnd = pos + kOpenTag.size();
        // "<apps>" or "<application" are other elements.
        if (nameEnd >= document.size() || !isSpace(document[nameEnd])) {
            pos = nameEnd;
            continue;
        }

        const std::size_t tagEnd = document.find('>', nameEnd);
        if (tagEnd == std::string_view::npos) {
            break;
        }
        const std::string_view attributes = document.substr(nameEnd, tagEnd - nameEnd);
        if (!attributes.empty() && attributes.back() == '/') {
            pos = tagEnd + 1; // self-closing, no name
            continue;
        }

        const std::size_t textStart = tagEnd + 1;
        const std::size_t closePos = document.find(kCloseTag, textStart);
        if (closePos == std::string_view::npos) {
            break;
        }
        const std::size_t nextOpen = document.find(kOpenTag, textStart);
        if (nextOpen != std::string_view::npos && nextOpen < closePos) {
            pos = nextOpen; // this record never closed; try the next one
            continue;
        }

        const auto id = idAttribute(attributes);
        if (id && !id->empty() && seen.insert(std::string(*id)).second) {
            apps.push_back(AppEntry{
                std::string(*id),
                decodeHtmlEntities(document.substr(textStart, closePos - textStart))});
        }
        pos = closePos + kCloseTag.size();
    }

    return apps;
}

std::string decodeHtmlEntities(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t amp = text.find('&', pos);
        if (amp == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, amp - pos));

        const std::size_t semi = text.find(';', amp + 1);
        if (semi == std::string_view::npos || semi - amp - 1 > kMaxEntityLength) {
            out += '&';
            pos = amp + 1;
            continue;
        }

        const std::string_view body = text.substr(amp + 1, semi - amp - 1);
        std::optional<std::uint32_t> cp;
        if (!body.empty() && body.front() == '#') {
            cp = numericReference(body.substr(1));
        } else {
            cp = namedReference(body);
        }

        if (cp) {
            appendUtf8(out, *cp);
            pos = semi + 1;
        } else {
            out += '&';
            pos = amp + 1;
        }
    }
    return out;
}

} // namespace ecp::catalog
