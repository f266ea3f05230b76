#pragma once

#include <string>
#include <vector>
#include <memory>
#include "incidex/types.hpp"

namespace incidex::engine {

    struct Config;

    /**
     * @brief Abstract base class for embedding generation.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @param text The input text.
         * @return A vector of dimension() floats. Remote failures yield a zero vector.
         */
        virtual Embedding embed(const std::string& text) = 0;

        /**
         * @brief Embeds texts in order, one vector per input.
         */
        virtual std::vector<Embedding> embed_batch(const std::vector<std::string>& texts);

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         */
        virtual size_t dimension() const = 0;

        /**
         * @brief Preferred number of texts per write batch.
         */
        virtual size_t batch_size() const { return 10; }

        /**
         * @brief Number of placeholder vectors substituted so far.
         */
        size_t degraded_count() const { return m_degraded; }

        virtual std::string name() const = 0;

    protected:
        Embedding placeholder();

    private:
        size_t m_degraded = 0;
    };

    // Remote services truncate input to this many characters.
    constexpr size_t kMaxEmbedChars = 2000;

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     size_t dimension, long timeout_seconds);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     const std::string& endpoint, size_t dimension,
                                                     long timeout_seconds);

    /**
     * @brief Builds the strategy named by cfg.embedding_backend.
     * @throws incidex::Error (InvalidConfig) for unknown backends or a model that fails to load.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& cfg);

}
