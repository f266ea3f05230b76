#include "layout.hpp"
#include "aliases.hpp"
#include "envelope.hpp"
#include "text.hpp"
#include "vector_store.hpp"
#include "incidex/errors.hpp"
#include "incidex/sha256.h"
#include <cmath>
#include <fstream>
#include <iostream>
#include <unordered_map>
#include <vector>

using json = nlohmann::json;

namespace incidex::engine {

    namespace {
        constexpr double kPi = 3.14159265358979323846;
    }

    SunPosition position_for(const std::string& project) {
        const auto digest = crypto::SHA256::hash(project);
        const double angle = crypto::SHA256::mod(digest, 360) * (kPi / 180.0);
        const double radius = 30.0 + crypto::SHA256::mod(digest, 50);

        SunPosition pos;
        pos.x = std::cos(angle) * radius;
        pos.y = static_cast<double>(crypto::SHA256::mod(digest, 20)) - 10.0;
        pos.z = std::sin(angle) * radius;
        return pos;
    }

    LayoutCache::LayoutCache(const Collection& collection, std::filesystem::path cache_file)
        : m_collection(collection), m_cache_file(std::move(cache_file)) {}

    json LayoutCache::get_layout(bool use_cache) {
        try {
            if (use_cache) {
                if (auto cached = read_valid_cache(m_collection.count())) return *cached;
            }

            std::cout << "[LayoutCache] Generating layout...\n";
            json layout = build();
            write_cache(layout);
            std::cout << "[LayoutCache] Layout generated: " << layout["total_projects"] << " projects\n";
            return layout;
        } catch (const std::exception& e) {
            std::cerr << "[LayoutCache] " << describe_nested(e) << "\n";
            json payload = error_payload(e, "layout failed");
            payload["success"] = false;
            return payload;
        }
    }

    json LayoutCache::build() const {
        Include include;
        include.documents = true;
        include.metadatas = true;
        include.embeddings = false;
        const auto dump = m_collection.get(include);

        if (dump.ids.empty()) {
            throw Error(ErrorKind::NoData, "no incidents stored; load incidents first");
        }
        std::cout << "[LayoutCache] Processing " << dump.ids.size() << " incidents...\n";

        std::vector<std::pair<std::string, json>> groups;
        std::unordered_map<std::string, size_t> group_index;

        for (size_t i = 0; i < dump.ids.size(); ++i) {
            const auto& metadata = dump.metadatas[i];
            const std::string project = aliases::resolve_or(metadata, aliases::kDisplayProject, aliases::kDefaultProject);

            auto [it, inserted] = group_index.emplace(project, groups.size());
            if (inserted) groups.emplace_back(project, json::array());

            json short_metadata = json::object();
            for (const auto& [key, value] : metadata) {
                short_metadata[key] = text::utf8_truncate(value, kLayoutMetadataChars);
            }
            groups[it->second].second.push_back(json{
                {"id", dump.ids[i]},
                {"text", text::utf8_truncate(dump.documents[i], kLayoutTextChars)},
                {"metadata", short_metadata}
            });
        }

        json suns = json::array();
        for (auto& [name, incidents] : groups) {
            const auto pos = position_for(name);
            const size_t total = incidents.size();

            json shown = json::array();
            for (size_t i = 0; i < total && i < kMaxIncidentsPerSun; ++i) {
                shown.push_back(std::move(incidents[i]));
            }

            suns.push_back(json{
                {"name", name},
                {"x", pos.x},
                {"y", pos.y},
                {"z", pos.z},
                {"size", total},
                {"incident_count", total},
                {"incidents", shown},
                {"has_more", total > kMaxIncidentsPerSun}
            });
        }

        return {
            {"success", true},
            {"suns", suns},
            {"total_projects", suns.size()},
            {"total_incidents", dump.ids.size()}
        };
    }

    std::optional<json> LayoutCache::read_valid_cache(size_t live_count) const {
        std::error_code ec;
        if (!std::filesystem::exists(m_cache_file, ec)) return std::nullopt;

        try {
            std::cout << "[LayoutCache] Loading layout from cache...\n";
            std::ifstream f(m_cache_file);
            json cached = json::parse(f);

            const auto total = cached.find("total_incidents");
            if (total != cached.end() && total->is_number_integer() && total->get<int64_t>() >= 0 &&
                static_cast<size_t>(total->get<int64_t>()) == live_count) {
                std::cout << "[LayoutCache] Cache valid: " << live_count << " incidents\n";
                return cached;
            }
            std::cout << "[LayoutCache] Cache stale ("
                      << (total != cached.end() ? total->dump() : "missing") << " vs " << live_count << ")\n";
        } catch (const json::exception& e) {
            std::cerr << "[LayoutCache] Error reading cache: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    bool LayoutCache::write_cache(const json& layout) const {
        auto tmp = m_cache_file;
        tmp += ".tmp";
        {
            std::ofstream f(tmp, std::ios::trunc);
            f << layout.dump(-1, ' ', false, json::error_handler_t::replace);
            if (!f) {
                std::cerr << "[LayoutCache] Could not write cache: " << tmp << "\n";
                return false;
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp, m_cache_file, ec);
        if (ec) {
            std::cerr << "[LayoutCache] Could not replace cache: " << ec.message() << "\n";
            std::filesystem::remove(tmp, ec);
            return false;
        }
        std::cout << "[LayoutCache] Cache saved\n";
        return true;
    }

}
