#include "embedder.hpp"
#include "tokenizer.hpp"
#include "incidex/errors.hpp"
#include <iostream>
#include <vector>
#include <algorithm>
#include <cmath>
#include <filesystem>

#ifdef INCIDEX_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace incidex::engine {

    /**
     * @brief Local sentence-embedding model (multilingual MiniLM exported to ONNX).
     *
     * The model is loaded once; embed_batch() pads the whole batch and runs a
     * single inference, then applies masked mean pooling and L2 normalisation.
     */
    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(const std::string& model_path, const std::string& vocab_path) {
#ifdef INCIDEX_WITH_ONNX
            if (!std::filesystem::exists(model_path) || !std::filesystem::exists(vocab_path)) {
                throw Error(ErrorKind::InvalidConfig, "ONNX model or vocab not found: " + model_path + ", " + vocab_path);
            }

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "incidex");

                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(1);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);
                m_tokenizer = std::make_unique<Tokenizer>(vocab_path);

                Ort::AllocatorWithDefaultOptions allocator;
                for (size_t i = 0; i < m_session->GetInputCount(); ++i) {
                    m_input_names.push_back(m_session->GetInputNameAllocated(i, allocator).get());
                }
                m_output_name = m_session->GetOutputNameAllocated(0, allocator).get();

                std::cout << "[OnnxEmbedder] Loaded: " << model_path << "\n";
            } catch (const Ort::Exception& e) {
                throw Error(ErrorKind::InvalidConfig, std::string("ONNX initialization failed: ") + e.what());
            }
#else
            (void)model_path;
            (void)vocab_path;
            throw Error(ErrorKind::InvalidConfig, "compiled without ONNX Runtime support");
#endif
        }

        Embedding embed(const std::string& text) override {
            return embed_batch({text}).front();
        }

        std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override {
            std::vector<Embedding> out;
#ifdef INCIDEX_WITH_ONNX
            if (texts.empty()) return out;

            // 1. Tokenize and pad to the longest sequence
            std::vector<std::vector<int64_t>> encoded;
            size_t seq_length = 0;
            for (const auto& text : texts) {
                encoded.push_back(m_tokenizer->encode(text));
                seq_length = std::max(seq_length, encoded.back().size());
            }

            const size_t batch = texts.size();
            std::vector<int64_t> input_ids(batch * seq_length, m_tokenizer->pad_id());
            std::vector<int64_t> attention_mask(batch * seq_length, 0);
            std::vector<int64_t> token_type_ids(batch * seq_length, 0);
            for (size_t b = 0; b < batch; ++b) {
                for (size_t i = 0; i < encoded[b].size(); ++i) {
                    input_ids[b * seq_length + i] = encoded[b][i];
                    attention_mask[b * seq_length + i] = 1;
                }
            }

            // 2. Prepare Tensors, in the order the model declares its inputs
            std::vector<int64_t> input_shape = { (int64_t)batch, (int64_t)seq_length };
            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            std::vector<Ort::Value> input_tensors;
            std::vector<const char*> input_names;
            for (const auto& name : m_input_names) {
                std::vector<int64_t>* source = nullptr;
                if (name == "input_ids") source = &input_ids;
                else if (name == "attention_mask") source = &attention_mask;
                else if (name == "token_type_ids") source = &token_type_ids;
                else throw Error(ErrorKind::InvalidConfig, "unexpected ONNX model input: " + name);

                input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, source->data(), source->size(),
                                                                          input_shape.data(), input_shape.size()));
                input_names.push_back(name.c_str());
            }
            const char* output_names[] = { m_output_name.c_str() };

            // 3. Run
            try {
                auto output_tensors = m_session->Run(Ort::RunOptions{nullptr}, input_names.data(), input_tensors.data(),
                                                     input_tensors.size(), output_names, 1);

                // 4. Masked mean pooling over [batch, seq, hidden]
                const float* float_data = output_tensors[0].GetTensorData<float>();
                auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
                const size_t hidden_size = static_cast<size_t>(shape[2]);
                m_dimension = hidden_size;

                for (size_t b = 0; b < batch; ++b) {
                    Embedding embedding(hidden_size, 0.0f);
                    const size_t tokens = encoded[b].size();
                    for (size_t i = 0; i < tokens; ++i) {
                        const float* row = float_data + (b * seq_length + i) * hidden_size;
                        for (size_t j = 0; j < hidden_size; ++j) embedding[j] += row[j];
                    }

                    float norm = 0.0f;
                    for (float& val : embedding) {
                        val /= (float)tokens;
                        norm += val * val;
                    }
                    norm = std::sqrt(norm);
                    for (float& val : embedding) val /= (norm + 1e-9f);
                    out.push_back(std::move(embedding));
                }
            } catch (const Ort::Exception& e) {
                std::cerr << "[OnnxEmbedder] Inference failed: " << e.what() << "\n";
                out.clear();
                for (size_t b = 0; b < batch; ++b) out.push_back(placeholder());
            }
#else
            (void)texts;
#endif
            return out;
        }

        size_t dimension() const override { return m_dimension; }
        size_t batch_size() const override { return 50; }
        std::string name() const override { return "onnx"; }

    private:
        size_t m_dimension = 384;
#ifdef INCIDEX_WITH_ONNX
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<Tokenizer> m_tokenizer;
        std::vector<std::string> m_input_names;
        std::string m_output_name;
#endif
    };

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path) {
        return std::make_unique<OnnxEmbedder>(model_path, vocab_path);
    }

}
