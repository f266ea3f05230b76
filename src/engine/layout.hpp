#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace incidex::engine {

    class Collection;

    constexpr size_t kMaxIncidentsPerSun = 500;
    constexpr size_t kLayoutTextChars = 150;
    constexpr size_t kLayoutMetadataChars = 50;

    struct SunPosition {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    /**
     * @brief Deterministic position for a project, derived from the SHA-256 of its name.
     *
     * With h the digest as an integer: angle = (h mod 360) degrees,
     * radius = 30 + (h mod 50), y = (h mod 20) - 10.
     */
    SunPosition position_for(const std::string& project);

    /**
     * @brief Per-project ("sun") layout of the collection, cached in a side file that
     * stays valid only while its total_incidents equals the collection count.
     */
    class LayoutCache {
    public:
        LayoutCache(const Collection& collection, std::filesystem::path cache_file);

        /**
         * @brief {success, suns, total_projects, total_incidents} or an error payload
         * with success false. Never throws.
         */
        nlohmann::json get_layout(bool use_cache = true);

        /**
         * @brief Computes the layout from the collection.
         * @throws incidex::Error (NoData) if the collection is empty.
         */
        nlohmann::json build() const;

        std::optional<nlohmann::json> read_valid_cache(size_t live_count) const;

        /**
         * @brief Whole-file replace through a temporary file. Failures are logged, not thrown.
         */
        bool write_cache(const nlohmann::json& layout) const;

        const std::filesystem::path& cache_file() const { return m_cache_file; }

    private:
        const Collection& m_collection;
        std::filesystem::path m_cache_file;
    };

}
