#pragma once

#include <memory>
#include <string>
#include <vector>

namespace incidex::engine {

    /**
     * @brief Retrieves raw markup for a URL.
     */
    class PageFetcher {
    public:
        virtual ~PageFetcher() = default;

        /**
         * @throws incidex::Error (SourceNotFound) on transport failure or an HTTP error status.
         */
        virtual std::string fetch(const std::string& url) = 0;
    };

    std::unique_ptr<PageFetcher> create_http_fetcher(long timeout_seconds);

    /**
     * @brief Visible text of every div/li/tr whose class mentions an incident keyword,
     * in document order (nested matches included).
     */
    std::vector<std::string> extract_incident_blocks(const std::string& html);

}
