#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <functional>

namespace retina::engine {

    struct FileInfo {
        std::filesystem::path path;
        std::uintmax_t size = 0;
    };

    class Scanner {
    public:
        using FileCallback = std::function<void(const FileInfo&)>;

        /**
         * @param extensions Accepted extensions including the dot, matched case-insensitively.
         */
        explicit Scanner(std::vector<std::string> extensions);

        /**
         * @brief Scans a directory recursively, skipping hidden entries.
         * @param root The root directory to scan.
         * @param callback Called for every matching file found.
         */
        void scan(const std::filesystem::path& root, FileCallback callback) const;

        /**
         * @brief All matching files under root, sorted by path.
         */
        std::vector<FileInfo> collect(const std::filesystem::path& root) const;

        bool accepts(const std::filesystem::path& path) const;

    private:
        std::vector<std::string> m_extensions;
    };

}
