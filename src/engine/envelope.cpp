#include "envelope.hpp"
#include "incidex/errors.hpp"

namespace incidex::engine {

    nlohmann::json error_payload(const std::exception& e, const std::string& context) {
        return {
            {"error", context + ": " + innermost_what(e)},
            {"error_kind", to_string(innermost_kind(e))},
            {"traceback", describe_nested(e)}
        };
    }

}
