#include "index_store.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

namespace retina::engine {

    namespace fs = std::filesystem;

    namespace {

        Error io_error(const std::string& what, int err) {
            return make_error(ErrorCode::IoError, what + ": " + std::strerror(err));
        }

        Error io_error(const std::string& what, const std::error_code& ec) {
            return make_error(ErrorCode::IoError, what + ": " + ec.message());
        }

        Result<void> sync_path(const fs::path& path, bool directory) {
            int flags = O_RDONLY | O_CLOEXEC;
            if (directory) flags |= O_DIRECTORY;
            int fd = ::open(path.c_str(), flags);
            if (fd < 0) return io_error("open " + path.string(), errno);
            int rc = ::fsync(fd);
            int err = errno;
            ::close(fd);
            if (rc != 0) return io_error("fsync " + path.string(), err);
            return {};
        }

        void discard(const fs::path& path) {
            std::error_code ec;
            fs::remove_all(path, ec);
            if (ec) std::cerr << "[IndexStore] Could not remove " << path << ": " << ec.message() << "\n";
        }

        // Swaps staging into target. Afterwards staging holds the previous unit.
        Result<void> exchange(const fs::path& staging, const fs::path& target) {
            if (::renameat2(AT_FDCWD, staging.c_str(), AT_FDCWD, target.c_str(), RENAME_EXCHANGE) == 0) {
                return {};
            }
            int err = errno;
            if (err != EINVAL && err != ENOSYS && err != EOPNOTSUPP) {
                return io_error("exchange " + target.string(), err);
            }

            // Filesystem without RENAME_EXCHANGE: move the old unit aside first.
            std::cerr << "[IndexStore] RENAME_EXCHANGE unsupported, falling back to two renames\n";
            fs::path aside = staging;
            aside += ".old";
            if (::rename(target.c_str(), aside.c_str()) != 0) return io_error("rename " + target.string(), errno);
            if (::rename(staging.c_str(), target.c_str()) != 0) {
                err = errno;
                if (::rename(aside.c_str(), target.c_str()) != 0) {
                    std::cerr << "[IndexStore] Could not restore " << target << ": " << std::strerror(errno) << "\n";
                }
                return io_error("rename " + staging.string(), err);
            }
            if (::rename(aside.c_str(), staging.c_str()) != 0) return io_error("rename " + aside.string(), errno);
            return {};
        }

    }

    IndexStore::IndexStore(fs::path root) : m_root(std::move(root)) {}

    Result<void> IndexStore::validate_name(const std::string& name) {
        if (name.empty()) return make_error(ErrorCode::InvalidArgument, "index name is empty");
        if (name.front() == '.') return make_error(ErrorCode::InvalidArgument, "index name may not start with '.': " + name);
        if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
            return make_error(ErrorCode::InvalidArgument, "index name may not contain a path separator: " + name);
        }
        return {};
    }

    Result<void> IndexStore::save(const VectorIndex& index, const std::string& name) const {
        if (auto valid = validate_name(name); !valid) return valid;

        std::error_code ec;
        fs::create_directories(m_root, ec);
        if (ec) return io_error("create " + m_root.string(), ec);

        const fs::path target = m_root / name;
        const fs::path staging = m_root / (".staging-" + name);
        if (fs::exists(staging, ec)) discard(staging);
        fs::create_directory(staging, ec);
        if (ec) return io_error("create " + staging.string(), ec);

        if (auto written = index.write_unit(staging); !written) {
            discard(staging);
            return written;
        }
        for (const char* file : {kGraphFile, kMetadataFile, kConfigFile}) {
            if (auto synced = sync_path(staging / file, false); !synced) {
                discard(staging);
                return synced;
            }
        }
        if (auto synced = sync_path(staging, true); !synced) {
            discard(staging);
            return synced;
        }

        if (fs::exists(target, ec)) {
            if (auto swapped = exchange(staging, target); !swapped) {
                discard(staging);
                return swapped;
            }
            discard(staging);
        } else if (::rename(staging.c_str(), target.c_str()) != 0) {
            int err = errno;
            discard(staging);
            return io_error("rename " + staging.string(), err);
        }

        if (auto synced = sync_path(m_root, true); !synced) return synced;

        std::cout << "[IndexStore] Saved '" << name << "' (" << index.size() << " items)\n";
        return {};
    }

    Result<std::unique_ptr<VectorIndex>> IndexStore::load(const std::string& name) const {
        if (auto valid = validate_name(name); !valid) return valid.error();

        const fs::path dir = m_root / name;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return make_error(ErrorCode::NotFound, "no index named '" + name + "' in " + m_root.string());
        }
        return VectorIndex::read_unit(dir);
    }

    Result<void> IndexStore::remove(const std::string& name) const {
        if (auto valid = validate_name(name); !valid) return valid;

        const fs::path target = m_root / name;
        std::error_code ec;
        if (!fs::is_directory(target, ec)) {
            return make_error(ErrorCode::NotFound, "no index named '" + name + "' in " + m_root.string());
        }

        // Hide the unit with one rename so it disappears as a whole.
        const fs::path trash = m_root / (".trash-" + name);
        if (fs::exists(trash, ec)) discard(trash);
        if (::rename(target.c_str(), trash.c_str()) != 0) return io_error("rename " + target.string(), errno);

        fs::remove_all(trash, ec);
        if (ec) return io_error("remove " + trash.string(), ec);
        if (auto synced = sync_path(m_root, true); !synced) return synced;

        std::cout << "[IndexStore] Deleted '" << name << "'\n";
        return {};
    }

    std::vector<std::string> IndexStore::list() const {
        std::vector<std::string> names;
        std::error_code ec;
        if (!fs::is_directory(m_root, ec)) return names;

        for (const auto& entry : fs::directory_iterator(m_root, fs::directory_options::skip_permission_denied, ec)) {
            std::string name = entry.path().filename().string();
            if (name.empty() || name.front() == '.') continue;
            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) names.push_back(std::move(name));
        }
        if (ec) std::cerr << "[IndexStore] Listing " << m_root << " failed: " << ec.message() << "\n";

        std::sort(names.begin(), names.end());
        return names;
    }

    bool IndexStore::exists(const std::string& name) const {
        if (!validate_name(name)) return false;
        std::error_code ec;
        return fs::is_directory(m_root / name, ec);
    }

}
