#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "incidex/types.hpp"

namespace incidex::engine::aliases {

    using AliasList = std::vector<std::string>;

    // Ingestion: source field spellings for each canonical incident field.
    extern const AliasList kId;
    extern const AliasList kTitle;
    extern const AliasList kDescription;
    extern const AliasList kProject;

    // Display: metadata spellings for the fields rebuilt on search results.
    extern const AliasList kDisplayId;
    extern const AliasList kDisplayProject;
    extern const AliasList kDisplayDate;
    extern const AliasList kDisplayDescription;
    extern const AliasList kDisplayResolution;
    extern const AliasList kDisplayStatus;
    extern const AliasList kDisplayPriority;

    extern const char* const kDefaultTitle;
    extern const char* const kDefaultProject;

    /**
     * @brief First alias present in fields, as (key, value).
     */
    std::optional<std::pair<std::string, std::string>> resolve(const Metadata& fields, const AliasList& aliases);

    /**
     * @brief Value of the first alias present, or fallback.
     */
    std::string resolve_or(const Metadata& fields, const AliasList& aliases, const std::string& fallback);

    bool contains(const AliasList& aliases, const std::string& key);

}
