#include "embedder.hpp"
#include "http.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace incidex::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, size_t dimension, long timeout_seconds)
            : m_model(model), m_endpoint(endpoint), m_dimension(dimension), m_timeout(timeout_seconds) {}

        Embedding embed(const std::string& text) override {
            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"prompt", text::utf8_truncate(text, kMaxEmbedChars)}
                };
                json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] JSON serialization error: " << e.what() << "\n";
                return placeholder();
            }

            auto response = http::post_json(m_endpoint, json_str, {}, m_timeout);
            if (!response.error.empty()) {
                std::cerr << "[OllamaEmbedder] Request failed: " << response.error << "\n";
                return placeholder();
            }
            if (!response.ok()) {
                std::cerr << "[OllamaEmbedder] HTTP " << response.status << " for text: "
                          << text::utf8_truncate(text, 50) << "...\n";
                return placeholder();
            }

            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("embedding")) {
                    auto embedding = resp_json["embedding"].get<Embedding>();
                    if (embedding.size() == m_dimension) return embedding;
                    std::cerr << "[OllamaEmbedder] Expected " << m_dimension << " dimensions, got "
                              << embedding.size() << "\n";
                } else {
                    std::cerr << "[OllamaEmbedder] Response has no embedding field\n";
                }
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] JSON parse error: " << e.what() << "\n";
            }
            return placeholder();
        }

        size_t dimension() const override { return m_dimension; }
        std::string name() const override { return "ollama:" + m_model; }

    private:
        std::string m_model;
        std::string m_endpoint;
        size_t m_dimension;
        long m_timeout;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     size_t dimension, long timeout_seconds) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, dimension, timeout_seconds);
    }

}
