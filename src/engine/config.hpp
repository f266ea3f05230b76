#pragma once

#include <string>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace incidex::engine {

    struct Config {
        std::filesystem::path data_dir; // empty: resolved by the host to the platform data dir
        std::string collection_name = "incidents";
        std::string embedding_backend = "ollama"; // ollama, openai, onnx
        std::string embedding_model = "nomic-embed-text";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings";
        size_t embedding_dimension = 768;
        long request_timeout_seconds = 30;
        long fetch_timeout_seconds = 15;
        std::string onnx_model_path = "model.onnx";
        std::string onnx_vocab_path = "vocab.txt";
        std::string openai_key = "";
        std::string socket_name = "incidex.sock";

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (std::filesystem::exists(path)) {
                try {
                    std::ifstream f(path);
                    cfg = from_json(nlohmann::json::parse(f));
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "[Config] Ignoring malformed " << path << ": " << e.what() << "\n";
                    cfg = Config{};
                }
            }
            cfg.apply_environment();
            return cfg;
        }

        static Config from_json(const nlohmann::json& j) {
            Config cfg;
            if (j.contains("data_dir")) cfg.data_dir = j["data_dir"].get<std::string>();
            if (j.contains("collection_name")) cfg.collection_name = j["collection_name"];
            if (j.contains("embedding_backend")) cfg.embedding_backend = j["embedding_backend"];
            if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"];
            if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"];
            if (j.contains("embedding_dimension")) cfg.embedding_dimension = j["embedding_dimension"];
            if (j.contains("request_timeout_seconds")) cfg.request_timeout_seconds = j["request_timeout_seconds"];
            if (j.contains("fetch_timeout_seconds")) cfg.fetch_timeout_seconds = j["fetch_timeout_seconds"];
            if (j.contains("onnx_model_path")) cfg.onnx_model_path = j["onnx_model_path"];
            if (j.contains("onnx_vocab_path")) cfg.onnx_vocab_path = j["onnx_vocab_path"];
            if (j.contains("openai_key")) cfg.openai_key = j["openai_key"];
            if (j.contains("socket_name")) cfg.socket_name = j["socket_name"];
            return cfg;
        }

        nlohmann::json to_json() const {
            nlohmann::json j;
            j["data_dir"] = data_dir.string();
            j["collection_name"] = collection_name;
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["embedding_dimension"] = embedding_dimension;
            j["request_timeout_seconds"] = request_timeout_seconds;
            j["fetch_timeout_seconds"] = fetch_timeout_seconds;
            j["onnx_model_path"] = onnx_model_path;
            j["onnx_vocab_path"] = onnx_vocab_path;
            if (!openai_key.empty()) j["openai_key"] = openai_key;
            j["socket_name"] = socket_name;
            return j;
        }

        void save(const std::filesystem::path& path) const {
            std::ofstream f(path);
            f << to_json().dump(4);
            if (!f) std::cerr << "[Config] Failed to write " << path << "\n";
        }

        void apply_environment() {
            if (const char* key = std::getenv("OPENAI_API_KEY")) openai_key = key;
            if (const char* dir = std::getenv("INCIDEX_DATA_DIR")) data_dir = dir;
        }
    };

}
