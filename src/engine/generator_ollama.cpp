#include "embedder.hpp"
#include "ollama_client.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>

using json = nlohmann::json;

namespace retina::engine {

    namespace {

        std::string base64_encode(const std::string& in) {
            static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
            std::string out;
            out.reserve(((in.size() + 2) / 3) * 4);

            size_t i = 0;
            for (; i + 2 < in.size(); i += 3) {
                uint32_t n = (static_cast<uint8_t>(in[i]) << 16) | (static_cast<uint8_t>(in[i + 1]) << 8) |
                             static_cast<uint8_t>(in[i + 2]);
                out += table[(n >> 18) & 63];
                out += table[(n >> 12) & 63];
                out += table[(n >> 6) & 63];
                out += table[n & 63];
            }
            if (i + 1 == in.size()) {
                uint32_t n = static_cast<uint8_t>(in[i]) << 16;
                out += table[(n >> 18) & 63];
                out += table[(n >> 12) & 63];
                out += "==";
            } else if (i + 2 == in.size()) {
                uint32_t n = (static_cast<uint8_t>(in[i]) << 16) | (static_cast<uint8_t>(in[i + 1]) << 8);
                out += table[(n >> 18) & 63];
                out += table[(n >> 12) & 63];
                out += table[(n >> 6) & 63];
                out += '=';
            }
            return out;
        }

        std::string build_prompt(const std::string& query, const std::string& context, const std::string& inline_text) {
            std::string prompt = "You are an assistant that analyses retrieved content. "
                                 "Answer the following question in detail, using only what the content shows.\n\n";
            prompt += "Question: " + query + "\n";
            if (!context.empty()) prompt += "Additional context: " + context + "\n";
            if (!inline_text.empty()) prompt += "\nContent:\n" + inline_text + "\n";
            prompt += "\nIf the question cannot be answered from the content, explain why.\n\nAnswer:";
            return prompt;
        }

    }

    class OllamaGenerator : public Generator {
    public:
        OllamaGenerator(const std::string& model, const std::string& endpoint, long timeout_seconds)
            : m_model(model), m_client(endpoint, timeout_seconds) {}

        Result<std::string> generate(const ContentRef& content, const std::string& query,
                                     const std::string& context) override {
            json body = {
                {"model", m_model},
                {"stream", false}
            };

            if (content.kind == ContentRef::Kind::File && is_image_file(content.path)) {
                auto bytes = read_content_text(content);
                if (!bytes) return make_error(ErrorCode::GenerationFailed, bytes.error().message);
                body["prompt"] = build_prompt(query, context, "");
                body["images"] = json::array({base64_encode(bytes.value())});
            } else {
                auto text = read_content_text(content);
                if (!text) return make_error(ErrorCode::GenerationFailed, text.error().message);
                body["prompt"] = build_prompt(query, context, text.value());
            }

            auto reply = m_client.post(body, ErrorCode::GenerationFailed);
            if (!reply) {
                std::cerr << "[OllamaGenerator] " << reply.error().message << "\n";
                return reply.error();
            }

            try {
                if (!reply->contains("response")) {
                    return make_error(ErrorCode::GenerationFailed, "response has no 'response' field");
                }
                return reply.value()["response"].get<std::string>();
            } catch (const std::exception& e) {
                return make_error(ErrorCode::GenerationFailed, std::string("JSON parse error: ") + e.what());
            }
        }

    private:
        std::string m_model;
        OllamaClient m_client;
    };

    std::unique_ptr<Generator> create_ollama_generator(const std::string& model, const std::string& endpoint,
                                                       long timeout_seconds) {
        return std::make_unique<OllamaGenerator>(model, endpoint, timeout_seconds);
    }

}
