#pragma once

#include <string>
#include <vector>

namespace incidex::engine::http {

    struct Response {
        long status = 0;
        std::string body;
        std::string error; // transport failure, empty on success

        bool ok() const { return error.empty() && status >= 200 && status < 300; }
    };

    Response post_json(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers, long timeout_seconds);

    Response get(const std::string& url, long timeout_seconds);

}
