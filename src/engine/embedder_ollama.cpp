#include "embedder.hpp"
#include "ollama_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>

using json = nlohmann::json;

namespace retina::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, long timeout_seconds)
            : m_model(model), m_client(endpoint, timeout_seconds) {}

        Result<Embedding> encode_one(const ContentRef& content) override {
            // The embeddings endpoint takes a text prompt only.
            if (content.kind == ContentRef::Kind::File && is_image_file(content.path)) {
                return make_error(ErrorCode::EncodingFailed,
                                  "image content needs a multimodal embedding model: " + content.path.string());
            }

            auto text = read_content_text(content);
            if (!text) return make_error(ErrorCode::EncodingFailed, text.error().message);

            json body = {
                {"model", m_model},
                {"prompt", text.value()}
            };
            auto reply = m_client.post(body, ErrorCode::EncodingFailed);
            if (!reply) {
                std::cerr << "[OllamaEmbedder] " << reply.error().message << "\n";
                return reply.error();
            }

            try {
                if (!reply->contains("embedding")) {
                    return make_error(ErrorCode::EncodingFailed, "response has no 'embedding' field");
                }
                Embedding embedding = reply.value()["embedding"].get<Embedding>();
                if (embedding.empty()) return make_error(ErrorCode::EncodingFailed, "empty embedding");
                m_dimension = embedding.size();
                return embedding;
            } catch (const std::exception& e) {
                return make_error(ErrorCode::EncodingFailed, std::string("JSON parse error: ") + e.what());
            }
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        OllamaClient m_client;
        std::atomic<size_t> m_dimension{0};
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     long timeout_seconds) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, timeout_seconds);
    }

}
