#include "scanner.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace retina::engine {

    namespace {

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            return s;
        }

    }

    Scanner::Scanner(std::vector<std::string> extensions) {
        for (auto& ext : extensions) m_extensions.push_back(lower(std::move(ext)));
    }

    bool Scanner::accepts(const std::filesystem::path& path) const {
        std::string ext = lower(path.extension().string());
        return std::find(m_extensions.begin(), m_extensions.end(), ext) != m_extensions.end();
    }

    void Scanner::scan(const std::filesystem::path& root, FileCallback callback) const {
        std::error_code ec;
        if (!std::filesystem::exists(root, ec) || !std::filesystem::is_directory(root, ec)) {
            std::cerr << "[Scanner] Invalid root path: " << root << "\n";
            return;
        }

        auto it = std::filesystem::recursive_directory_iterator(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            const auto& path = it->path();

            std::string name = path.filename().string();
            if (!name.empty() && name.front() == '.') {
                if (it->is_directory(ec)) it.disable_recursion_pending();
                continue;
            }

            if (it->is_regular_file(ec) && accepts(path)) {
                FileInfo info;
                info.path = path;
                info.size = it->file_size(ec);
                if (ec) {
                    std::cerr << "[Scanner] Cannot stat " << path << ": " << ec.message() << "\n";
                    ec.clear();
                    continue;
                }
                if (callback) callback(info);
            }
            ec.clear();
        }
        if (ec) std::cerr << "[Scanner] Stopped scanning " << root << ": " << ec.message() << "\n";
    }

    std::vector<FileInfo> Scanner::collect(const std::filesystem::path& root) const {
        std::vector<FileInfo> files;
        scan(root, [&files](const FileInfo& info) { files.push_back(info); });
        std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
        return files;
    }

}
