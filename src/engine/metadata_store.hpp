#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    /**
     * @brief Maps item ids to their Records.
     *
     * Ids are positions: the n-th appended record has id n, matching the
     * graph's id space. Held in memory; persisted as a SQLite database.
     */
    class MetadataStore {
    public:
        /**
         * @brief Appends a record and returns its id.
         */
        std::uint64_t append(Record record);

        /**
         * @brief Returns the record for an id, or nullptr if out of range.
         */
        const Record* get(std::uint64_t id) const;

        size_t size() const { return m_records.size(); }
        bool empty() const { return m_records.empty(); }

        /**
         * @brief Writes all records to a new SQLite database at path.
         * The file must not exist yet.
         */
        Result<void> write(const std::filesystem::path& path) const;

        /**
         * @brief Reads a database written by write().
         */
        static Result<MetadataStore> read(const std::filesystem::path& path);

    private:
        std::vector<Record> m_records;
    };

}
