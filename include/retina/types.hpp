#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace retina::engine {

    using Embedding = std::vector<float>;

    // Scalar or string attribute value.
    using Value = std::variant<bool, std::int64_t, double, std::string>;

    /**
     * @brief Ordered key/value attributes describing a stored item.
     * Opaque to the index; only callers interpret the keys.
     */
    class Record {
    public:
        using Field = std::pair<std::string, Value>;

        /**
         * @brief Sets a key. An existing key keeps its position.
         */
        void set(const std::string& key, Value value) {
            for (auto& field : m_fields) {
                if (field.first == key) {
                    field.second = std::move(value);
                    return;
                }
            }
            m_fields.emplace_back(key, std::move(value));
        }

        // A string literal would otherwise convert to bool.
        void set(const std::string& key, const char* value) {
            set(key, Value(std::string(value)));
        }

        const Value* get(const std::string& key) const {
            for (const auto& field : m_fields) {
                if (field.first == key) return &field.second;
            }
            return nullptr;
        }

        std::string get_string(const std::string& key, const std::string& fallback = "") const {
            const Value* value = get(key);
            if (value && std::holds_alternative<std::string>(*value)) return std::get<std::string>(*value);
            return fallback;
        }

        bool contains(const std::string& key) const { return get(key) != nullptr; }
        size_t size() const { return m_fields.size(); }
        bool empty() const { return m_fields.empty(); }

        const std::vector<Field>& fields() const { return m_fields; }
        std::vector<Field>::const_iterator begin() const { return m_fields.begin(); }
        std::vector<Field>::const_iterator end() const { return m_fields.end(); }

        bool operator==(const Record& other) const { return m_fields == other.m_fields; }
        bool operator!=(const Record& other) const { return !(*this == other); }

    private:
        std::vector<Field> m_fields;
    };

    /**
     * @brief Reference to content handed to the embedder or generator:
     * either inline text or a file on disk.
     */
    struct ContentRef {
        enum class Kind { Text, File };

        Kind kind = Kind::Text;
        std::string text;
        std::filesystem::path path;

        static ContentRef from_text(std::string text) {
            ContentRef ref;
            ref.kind = Kind::Text;
            ref.text = std::move(text);
            return ref;
        }

        static ContentRef from_file(std::filesystem::path path) {
            ContentRef ref;
            ref.kind = Kind::File;
            ref.path = std::move(path);
            return ref;
        }

        std::string describe() const {
            return kind == Kind::File ? path.string() : text;
        }
    };

    // (id, distance) pair returned by the index.
    struct Neighbor {
        std::uint64_t id;
        float distance;
    };

    /**
     * @brief Cooperative cancellation flag for an in-flight query.
     */
    class CancellationToken {
    public:
        void cancel() { m_cancelled = true; }
        bool cancelled() const { return m_cancelled; }

    private:
        std::atomic<bool> m_cancelled{false};
    };

}
