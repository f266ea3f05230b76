#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "incidex/types.hpp"

namespace incidex::engine {

    struct Table {
        std::vector<std::string> columns;
        std::vector<std::vector<std::string>> rows;
    };

    /**
     * @brief Parses delimited text (RFC 4180 quoting, CRLF or LF, leading UTF-8 BOM dropped).
     * The first record is the header; blank lines are skipped and short rows padded.
     */
    Table parse_delimited(const std::string& content, char delimiter);

    /**
     * @throws incidex::Error SourceNotFound if the file cannot be read.
     */
    Table read_delimited(const std::filesystem::path& path, char delimiter);

    /**
     * @brief Parses a structured document preserving key order.
     * @throws incidex::Error SourceNotFound if unreadable, UnsupportedFormat if not valid JSON.
     */
    nlohmann::ordered_json read_document(const std::filesystem::path& path);

    /**
     * @brief Locates the list of records inside a document.
     *
     * A root list is used directly. Otherwise the well-known container keys are
     * tried in priority order, then the first list-valued field anywhere in the
     * document (depth first, document order).
     * @return nullptr if the document holds no list.
     */
    const nlohmann::ordered_json* find_item_list(const nlohmann::ordered_json& document);

    /**
     * @brief Flattens one record into string fields. Nulls are dropped; non-string
     * values are serialised compactly.
     */
    Metadata flatten_item(const nlohmann::ordered_json& item);

}
