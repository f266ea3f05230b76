#include "aliases.hpp"
#include <algorithm>

namespace incidex::engine::aliases {

    const AliasList kId = {"id", "ID", "_id"};
    const AliasList kTitle = {"title", "titulo", "Proyecto", "nombre"};
    const AliasList kDescription = {"description", "descripcion", "Descripción", "desc"};
    const AliasList kProject = {"Proyecto", "proyecto", "project"};

    const AliasList kDisplayId = {"ID", "id", "Identificador_incidencia"};
    const AliasList kDisplayProject = {"project", "Proyecto", "proyecto"};
    const AliasList kDisplayDate = {"date", "Fecha", "fecha", "Fecha_envío_incidencia", "Fecha del incidente"};
    const AliasList kDisplayDescription = {"description", "Descripción", "descripcion", "Descripcion Problema", "Descripción_incidencia"};
    const AliasList kDisplayResolution = {"resolution", "Solución", "solucion", "Solucion"};
    const AliasList kDisplayStatus = {"status", "Estado", "estado"};
    const AliasList kDisplayPriority = {"priority", "Prioridad", "prioridad"};

    const char* const kDefaultTitle = "Untitled";
    const char* const kDefaultProject = "No project";

    std::optional<std::pair<std::string, std::string>> resolve(const Metadata& fields, const AliasList& aliases) {
        for (const auto& key : aliases) {
            auto it = fields.find(key);
            if (it != fields.end()) return std::make_pair(it->first, it->second);
        }
        return std::nullopt;
    }

    std::string resolve_or(const Metadata& fields, const AliasList& aliases, const std::string& fallback) {
        auto match = resolve(fields, aliases);
        return match ? match->second : fallback;
    }

    bool contains(const AliasList& aliases, const std::string& key) {
        return std::find(aliases.begin(), aliases.end(), key) != aliases.end();
    }

}
