// AppCatalog.hpp
// -----------------------------------------------------------------------------
// Parsing for the `/query/apps` document. Not a markup parser:
// it only recognises flat `<app ... id="...">name</app>` records and
// skips everything else.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ecp::catalog {

struct AppEntry {
    std::string id;    ///< Opaque id used by `/launch/<id>`; never empty.
    std::string name;  ///< Display name with entities decoded.

    friend bool operator==(const AppEntry& a, const AppEntry& b) {
        return a.id == b.id && a.name == b.name;
    }
};

/**
 * @brief Extract app records from a catalog document.
 *
 * A record is `<app`, then whitespace, then attributes including
 * `id="..."`, then `>`, the display name and `</app>`. Other attributes are
 * ignored. Records without an id, with an empty id, self-closing records and
 * records whose closing tag is missing or preceded by another `<app` are
 * skipped. When an id repeats, the first record wins. Document order is kept.
 */
std::vector<AppEntry> parseAppCatalog(std::string_view document);

/**
 * @brief Replace HTML character references with their UTF-8 text.
 *
 * Handles decimal (`&#38;`) and hex (`&#x26;`) references plus the XML
 * entities and the common HTML named entities. Anything unrecognised, or
 * missing its `;`, is copied through unchanged.
 */
std::string decodeHtmlEntities(std::string_view text);

} // namespace ecp::catalog
