#include "service.hpp"
#include "envelope.hpp"
#include "incident_rag.hpp"
#include "incidex/errors.hpp"
#include <iostream>

using json = nlohmann::json;

namespace incidex::engine {

    namespace {
        Metadata to_filters(const json& filters) {
            Metadata out;
            if (filters.is_null()) return out;
            if (!filters.is_object()) throw Error(ErrorKind::InvalidArgument, "filters must be an object");
            for (const auto& [key, value] : filters.items()) {
                out[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
            return out;
        }
    }

    Service::Service(IncidentRag& rag) : m_rag(rag) {}

    std::string Service::handle(const std::string& request) {
        json response;
        try {
            response = dispatch(json::parse(request));
        } catch (const json::parse_error& e) {
            response = error_payload(Error(ErrorKind::InvalidArgument, std::string("invalid json: ") + e.what()),
                                     "bad request");
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json Service::dispatch(const json& request) {
        try {
            if (!request.is_object()) throw Error(ErrorKind::InvalidArgument, "request must be an object");
            const std::string method = request.value("method", "");
            const json params = request.value("params", json::object());

            if (method == "ping") return {{"success", true}, {"result", "pong"}};
            if (method == "ingest") {
                return m_rag.ingest(params.at("source").get<std::string>(), params.value("source_type", "file"));
            }
            if (method == "search") {
                return m_rag.search(params.at("query").get<std::string>(), params.value("top_k", 5),
                                    to_filters(params.value("filters", json())));
            }
            if (method == "stats") return m_rag.stats();
            if (method == "layout") return m_rag.layout(params.value("use_cache", true));
            if (method == "clear") return m_rag.clear();

            throw Error(ErrorKind::InvalidArgument, "unknown method: " + method);
        } catch (const json::exception& e) {
            std::cerr << "[Service] Bad parameters: " << e.what() << "\n";
            return error_payload(Error(ErrorKind::InvalidArgument, e.what()), "bad request");
        } catch (const Error& e) {
            return error_payload(e, "bad request");
        }
    }

}
