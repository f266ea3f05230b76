#include "embedder.hpp"
#include "config.hpp"
#include "incidex/errors.hpp"

namespace incidex::engine {

    std::vector<Embedding> Embedder::embed_batch(const std::vector<std::string>& texts) {
        std::vector<Embedding> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            out.push_back(embed(text));
        }
        return out;
    }

    Embedding Embedder::placeholder() {
        ++m_degraded;
        return Embedding(dimension(), 0.0f);
    }

    std::unique_ptr<Embedder> create_embedder(const Config& cfg) {
        if (cfg.embedding_backend == "ollama") {
            return create_ollama_embedder(cfg.embedding_model, cfg.embedding_endpoint,
                                          cfg.embedding_dimension, cfg.request_timeout_seconds);
        }
        if (cfg.embedding_backend == "openai") {
            if (cfg.openai_key.empty()) {
                throw Error(ErrorKind::InvalidConfig, "openai backend requires openai_key or OPENAI_API_KEY");
            }
            // The ollama default endpoint makes no sense here; fall back to the public API.
            std::string endpoint = cfg.embedding_endpoint;
            if (endpoint == Config{}.embedding_endpoint) endpoint = "https://api.openai.com/v1/embeddings";
            std::string model = cfg.embedding_model;
            if (model == Config{}.embedding_model) model = "text-embedding-3-small";
            return create_openai_embedder(cfg.openai_key, model, endpoint,
                                          cfg.embedding_dimension, cfg.request_timeout_seconds);
        }
        if (cfg.embedding_backend == "onnx") {
            return create_onnx_embedder(cfg.onnx_model_path, cfg.onnx_vocab_path);
        }
        throw Error(ErrorKind::InvalidConfig, "unknown embedding_backend: " + cfg.embedding_backend);
    }

}
