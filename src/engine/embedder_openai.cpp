#include "embedder.hpp"
#include "http.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace incidex::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, const std::string& endpoint,
                       size_t dimension, long timeout_seconds)
            : m_api_key(api_key), m_model(model), m_endpoint(endpoint),
              m_dimension(dimension), m_timeout(timeout_seconds) {}

        Embedding embed(const std::string& text) override {
            json body = {
                {"model", m_model},
                {"input", text::utf8_truncate(text, kMaxEmbedChars)},
                {"dimensions", m_dimension}
            };
            std::string json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);

            auto response = http::post_json(m_endpoint, json_str, {"Authorization: Bearer " + m_api_key}, m_timeout);
            if (!response.error.empty()) {
                std::cerr << "[OpenAIEmbedder] Request failed: " << response.error << "\n";
                return placeholder();
            }

            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("error")) {
                    std::cerr << "[OpenAIEmbedder] API Error: " << resp_json["error"].dump() << "\n";
                } else if (!response.ok()) {
                    std::cerr << "[OpenAIEmbedder] HTTP " << response.status << "\n";
                } else if (resp_json.contains("data") && !resp_json["data"].empty()) {
                    auto embedding = resp_json["data"][0]["embedding"].get<Embedding>();
                    if (embedding.size() == m_dimension) return embedding;
                    std::cerr << "[OpenAIEmbedder] Expected " << m_dimension << " dimensions, got "
                              << embedding.size() << "\n";
                }
            } catch (const json::exception& e) {
                std::cerr << "[OpenAIEmbedder] JSON parse error: " << e.what() << "\n";
            }
            return placeholder();
        }

        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "openai:" + m_model; }

    private:
        std::string m_api_key;
        std::string m_model;
        std::string m_endpoint;
        size_t m_dimension;
        long m_timeout;
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     const std::string& endpoint, size_t dimension,
                                                     long timeout_seconds) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, endpoint, dimension, timeout_seconds);
    }

}
