#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "index_config.hpp"

namespace retina::engine {

    struct Config {
        IndexConfig index;                        // dimension 0: taken from the first embedding
        float similarity_threshold = 0.2f;
        bool normalize = true;                    // L2-normalize before insert and search
        size_t generation_concurrency_limit = 2;
        size_t top_k = 3;
        size_t batch_size = 32;

        std::string content_dir = "content";
        std::string index_dir = ".retina/indexes";
        std::string index_name = "default";
        std::string results_dir = "results";
        std::vector<std::string> extensions = {".txt", ".md"};

        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings";
        std::string generation_model = "llava";
        std::string generation_endpoint = "http://localhost:11434/api/generate";
        long request_timeout_seconds = 60;

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("index")) cfg.index = j["index"].get<IndexConfig>();
                if (j.contains("similarity_threshold")) cfg.similarity_threshold = j["similarity_threshold"];
                if (j.contains("normalize")) cfg.normalize = j["normalize"];
                if (j.contains("generation_concurrency_limit")) cfg.generation_concurrency_limit = j["generation_concurrency_limit"];
                if (j.contains("top_k")) cfg.top_k = j["top_k"];
                if (j.contains("batch_size")) cfg.batch_size = j["batch_size"];
                if (j.contains("content_dir")) cfg.content_dir = j["content_dir"].get<std::string>();
                if (j.contains("index_dir")) cfg.index_dir = j["index_dir"].get<std::string>();
                if (j.contains("index_name")) cfg.index_name = j["index_name"].get<std::string>();
                if (j.contains("results_dir")) cfg.results_dir = j["results_dir"].get<std::string>();
                if (j.contains("extensions")) cfg.extensions = j["extensions"].get<std::vector<std::string>>();
                if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"].get<std::string>();
                if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"].get<std::string>();
                if (j.contains("generation_model")) cfg.generation_model = j["generation_model"].get<std::string>();
                if (j.contains("generation_endpoint")) cfg.generation_endpoint = j["generation_endpoint"].get<std::string>();
                if (j.contains("request_timeout_seconds")) cfg.request_timeout_seconds = j["request_timeout_seconds"];
            } catch (const std::exception& e) {
                std::cerr << "[Config] Failed to parse " << path << ", using defaults: " << e.what() << "\n";
                return Config();
            }
            return cfg;
        }

        bool save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["index"] = index;
            j["similarity_threshold"] = similarity_threshold;
            j["normalize"] = normalize;
            j["generation_concurrency_limit"] = generation_concurrency_limit;
            j["top_k"] = top_k;
            j["batch_size"] = batch_size;
            j["content_dir"] = content_dir;
            j["index_dir"] = index_dir;
            j["index_name"] = index_name;
            j["results_dir"] = results_dir;
            j["extensions"] = extensions;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["generation_model"] = generation_model;
            j["generation_endpoint"] = generation_endpoint;
            j["request_timeout_seconds"] = request_timeout_seconds;

            std::ofstream f(path);
            f << j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
            f.close();
            if (!f) {
                std::cerr << "[Config] Failed to write " << path << "\n";
                return false;
            }
            return true;
        }
    };

}
