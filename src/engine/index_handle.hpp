#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "index_store.hpp"
#include "vector_index.hpp"

namespace retina::engine {

    /**
     * @brief Owns the current index and the store it is saved to.
     *
     * Lifecycle: create -> open/build -> [search|insert]* -> close.
     * current() hands out a shared reference, so publishing a rebuilt
     * index never invalidates a query already running on the old one.
     */
    class IndexHandle {
    public:
        explicit IndexHandle(std::filesystem::path root);

        std::shared_ptr<VectorIndex> current() const;
        bool has_index() const { return current() != nullptr; }

        /**
         * @brief Replaces the current index.
         */
        void publish(std::shared_ptr<VectorIndex> index);

        /**
         * @brief Publishes a new, empty index.
         */
        Result<void> create(const IndexConfig& config);

        Result<void> open(const std::string& name);
        Result<void> save(const std::string& name) const;
        Result<void> remove(const std::string& name) const;
        std::vector<std::string> list() const { return m_store.list(); }

        void close();

        const IndexStore& store() const { return m_store; }

    private:
        IndexStore m_store;
        mutable std::mutex m_mutex;
        std::shared_ptr<VectorIndex> m_current;
    };

}
