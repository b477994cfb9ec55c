#include "index_handle.hpp"
#include <iostream>

namespace retina::engine {

    IndexHandle::IndexHandle(std::filesystem::path root) : m_store(std::move(root)) {}

    std::shared_ptr<VectorIndex> IndexHandle::current() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

    void IndexHandle::publish(std::shared_ptr<VectorIndex> index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current = std::move(index);
    }

    Result<void> IndexHandle::create(const IndexConfig& config) {
        auto index = VectorIndex::create(config);
        if (!index) return index.error();
        publish(std::move(index.value()));
        return {};
    }

    Result<void> IndexHandle::open(const std::string& name) {
        auto index = m_store.load(name);
        if (!index) return index.error();

        std::cout << "[IndexHandle] Opened '" << name << "' with " << index.value()->size() << " items\n";
        publish(std::move(index.value()));
        return {};
    }

    Result<void> IndexHandle::save(const std::string& name) const {
        auto index = current();
        if (!index) return make_error(ErrorCode::NotReady, "no index to save");
        return m_store.save(*index, name);
    }

    Result<void> IndexHandle::remove(const std::string& name) const {
        return m_store.remove(name);
    }

    void IndexHandle::close() {
        publish(nullptr);
    }

}
