#pragma once

#include <exception>
#include <string>
#include <nlohmann/json.hpp>

namespace incidex::engine {

    /**
     * @brief Result-level error payload: {error, error_kind, traceback}.
     * @param context Short description of the failed operation, prefixed to the message.
     */
    nlohmann::json error_payload(const std::exception& e, const std::string& context);

}
