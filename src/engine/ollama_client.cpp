#include "ollama_client.hpp"
#include <curl/curl.h>

using json = nlohmann::json;

namespace retina::engine {

    namespace {

        size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

    }

    OllamaClient::OllamaClient(std::string endpoint, long timeout_seconds)
        : m_endpoint(std::move(endpoint)), m_timeout_seconds(timeout_seconds) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    OllamaClient::~OllamaClient() {
        curl_global_cleanup();
    }

    Result<json> OllamaClient::post(const json& body, ErrorCode failure_code) const {
        std::string json_str;
        try {
            json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const std::exception& e) {
            return make_error(failure_code, std::string("JSON serialization error: ") + e.what());
        }

        CURL* curl = curl_easy_init();
        if (!curl) return make_error(failure_code, "curl_easy_init failed");

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        std::string response_string;
        curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_str.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return make_error(failure_code, std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res));
        }
        if (status < 200 || status >= 300) {
            return make_error(failure_code, m_endpoint + " returned HTTP " + std::to_string(status));
        }

        try {
            return json::parse(response_string);
        } catch (const std::exception& e) {
            return make_error(failure_code, std::string("JSON parse error: ") + e.what());
        }
    }

}
