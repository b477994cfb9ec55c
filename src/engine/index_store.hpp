#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "retina/result.hpp"
#include "vector_index.hpp"

namespace retina::engine {

    /**
     * @brief A root directory of named persisted units.
     *
     * Each unit is a directory <root>/<name>/ holding graph.bin,
     * metadata.db and config.json. A save is staged in a hidden directory
     * and swapped in with one rename, so readers see either the old unit
     * or the new one.
     */
    class IndexStore {
    public:
        explicit IndexStore(std::filesystem::path root);

        Result<void> save(const VectorIndex& index, const std::string& name) const;
        Result<std::unique_ptr<VectorIndex>> load(const std::string& name) const;

        /**
         * @brief Deletes all three artifacts of a unit together.
         */
        Result<void> remove(const std::string& name) const;

        /**
         * @brief Names of the stored units, sorted. Hidden staging entries are skipped.
         */
        std::vector<std::string> list() const;
        bool exists(const std::string& name) const;

        const std::filesystem::path& root() const { return m_root; }

        /**
         * @brief Names must be non-empty, must not start with '.', and must not contain a path separator.
         */
        static Result<void> validate_name(const std::string& name);

    private:
        std::filesystem::path m_root;
    };

}
