#include "http.hpp"
#include <curl/curl.h>

namespace incidex::engine::http {

    namespace {

        struct CurlGlobal {
            CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
            ~CurlGlobal() { curl_global_cleanup(); }
        };

        void ensure_global_init() {
            static CurlGlobal global;
        }

        size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

        Response perform(CURL* curl, long timeout_seconds) {
            Response response;
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                response.error = curl_easy_strerror(res);
            } else {
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
            }
            return response;
        }

    }

    Response post_json(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers, long timeout_seconds) {
        ensure_global_init();
        CURL* curl = curl_easy_init();
        if (!curl) return Response{0, "", "curl_easy_init failed"};

        struct curl_slist* header_list = nullptr;
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
        for (const auto& h : headers) {
            header_list = curl_slist_append(header_list, h.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

        Response response = perform(curl, timeout_seconds);

        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);
        return response;
    }

    Response get(const std::string& url, long timeout_seconds) {
        ensure_global_init();
        CURL* curl = curl_easy_init();
        if (!curl) return Response{0, "", "curl_easy_init failed"};

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "incidex/0.1");

        Response response = perform(curl, timeout_seconds);

        curl_easy_cleanup(curl);
        return response;
    }

}
