#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "retina/result.hpp"

namespace retina::engine {

    /**
     * @brief Minimal JSON-over-HTTP client for an Ollama-compatible endpoint.
     */
    class OllamaClient {
    public:
        OllamaClient(std::string endpoint, long timeout_seconds);
        ~OllamaClient();

        OllamaClient(const OllamaClient&) = delete;
        OllamaClient& operator=(const OllamaClient&) = delete;

        /**
         * @brief POSTs body and parses the JSON reply.
         * Transport, HTTP and parse errors are reported with failure_code.
         */
        Result<nlohmann::json> post(const nlohmann::json& body, ErrorCode failure_code) const;

        const std::string& endpoint() const { return m_endpoint; }

    private:
        std::string m_endpoint;
        long m_timeout_seconds;
    };

}
