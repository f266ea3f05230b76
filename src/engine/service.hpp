#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace incidex::engine {

    class IncidentRag;

    /**
     * @brief JSON request dispatcher in front of IncidentRag.
     *
     * Requests are {"method": ..., "params": {...}} with methods ping, ingest,
     * search, stats, layout and clear. Every response carries "success" or "error".
     */
    class Service {
    public:
        explicit Service(IncidentRag& rag);

        std::string handle(const std::string& request);
        nlohmann::json dispatch(const nlohmann::json& request);

    private:
        IncidentRag& m_rag;
    };

}
