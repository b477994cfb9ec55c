#include "vector_index.hpp"
#include <fstream>
#include <iostream>
#include <mutex>

namespace retina::engine {

    void to_json(nlohmann::json& j, const IndexStatistics& stats) {
        j = nlohmann::json{
            {"num_elements", stats.num_elements},
            {"dimension", stats.dimension},
            {"space", stats.space},
            {"M", stats.M},
            {"ef_construction", stats.ef_construction},
            {"ef_search", stats.ef_search},
            {"max_elements", stats.max_elements},
            {"max_level", stats.max_level}
        };
    }

    VectorIndex::VectorIndex(HnswGraph graph, MetadataStore metadata)
        : m_config(graph.config()), m_graph(std::move(graph)), m_metadata(std::move(metadata)) {}

    Result<std::unique_ptr<VectorIndex>> VectorIndex::create(const IndexConfig& config) {
        if (auto valid = config.validate(); !valid) return valid.error();
        return std::unique_ptr<VectorIndex>(new VectorIndex(HnswGraph(config), MetadataStore()));
    }

    Result<std::uint64_t> VectorIndex::insert(const Embedding& embedding, Record record) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        if (embedding.size() != m_config.dimension) {
            return make_error(ErrorCode::DimensionMismatch,
                              "expected " + std::to_string(m_config.dimension) + ", got " + std::to_string(embedding.size()));
        }
        if (m_graph.size() >= m_config.max_elements) {
            return make_error(ErrorCode::CapacityExceeded,
                              "index holds max_elements=" + std::to_string(m_config.max_elements));
        }

        const std::uint64_t id = m_graph.add(embedding.data());
        m_metadata.append(std::move(record));
        return id;
    }

    Result<std::vector<Neighbor>> VectorIndex::search(const Embedding& query, size_t k) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);

        if (m_graph.empty()) return make_error(ErrorCode::IndexEmpty, "no items indexed");
        if (query.size() != m_config.dimension) {
            return make_error(ErrorCode::DimensionMismatch,
                              "expected " + std::to_string(m_config.dimension) + ", got " + std::to_string(query.size()));
        }
        return m_graph.search(query.data(), k);
    }

    std::optional<Record> VectorIndex::record(std::uint64_t id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        const Record* rec = m_metadata.get(id);
        if (!rec) return std::nullopt;
        return *rec;
    }

    size_t VectorIndex::size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_graph.size();
    }

    IndexStatistics VectorIndex::statistics() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        IndexStatistics stats;
        stats.num_elements = m_graph.size();
        stats.dimension = m_config.dimension;
        stats.space = metric_name(m_config.metric);
        stats.M = m_config.M;
        stats.ef_construction = m_config.ef_construction;
        stats.ef_search = m_config.ef_search;
        stats.max_elements = m_config.max_elements;
        stats.max_level = m_graph.max_level();
        return stats;
    }

    Result<void> VectorIndex::write_unit(const std::filesystem::path& dir) const {
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        {
            std::ofstream out(dir / kGraphFile, std::ios::binary | std::ios::trunc);
            if (!out) return make_error(ErrorCode::IoError, "cannot create " + (dir / kGraphFile).string());
            m_graph.serialize(out);
            out.close();
            if (!out) return make_error(ErrorCode::IoError, "failed writing " + (dir / kGraphFile).string());
        }

        if (auto written = m_metadata.write(dir / kMetadataFile); !written) return written.error();

        nlohmann::json descriptor = m_config;
        descriptor["element_count"] = m_graph.size();
        descriptor["format_version"] = kFormatVersion;

        std::ofstream f(dir / kConfigFile, std::ios::trunc);
        if (!f) return make_error(ErrorCode::IoError, "cannot create " + (dir / kConfigFile).string());
        f << descriptor.dump(2);
        f.close();
        if (!f) return make_error(ErrorCode::IoError, "failed writing " + (dir / kConfigFile).string());
        return {};
    }

    Result<std::unique_ptr<VectorIndex>> VectorIndex::read_unit(const std::filesystem::path& dir) {
        std::string missing;
        for (const char* name : {kGraphFile, kMetadataFile, kConfigFile}) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(dir / name, ec)) {
                missing += missing.empty() ? name : std::string(", ") + name;
            }
        }
        if (!missing.empty()) {
            return make_error(ErrorCode::NotFound, dir.string() + ": missing " + missing);
        }

        IndexConfig config;
        size_t element_count = 0;
        try {
            std::ifstream f(dir / kConfigFile);
            nlohmann::json j = nlohmann::json::parse(f);
            config = j.get<IndexConfig>();
            element_count = j.at("element_count").get<size_t>();
            if (j.value("format_version", 0) != kFormatVersion) {
                return make_error(ErrorCode::CorruptState, "unsupported format_version in " + (dir / kConfigFile).string());
            }
        } catch (const std::exception& e) {
            return make_error(ErrorCode::CorruptState, "config descriptor: " + std::string(e.what()));
        }

        std::ifstream in(dir / kGraphFile, std::ios::binary);
        auto graph = HnswGraph::deserialize(in);
        if (!graph) return graph.error();

        if (graph->config() != config) {
            return make_error(ErrorCode::CorruptState, "configuration and graph disagree");
        }
        if (graph->size() != element_count) {
            return make_error(ErrorCode::CorruptState,
                              "descriptor lists " + std::to_string(element_count) + " elements, graph holds " +
                              std::to_string(graph->size()));
        }

        auto metadata = MetadataStore::read(dir / kMetadataFile);
        if (!metadata) return metadata.error();
        if (metadata->size() != graph->size()) {
            return make_error(ErrorCode::CorruptState,
                              "metadata holds " + std::to_string(metadata->size()) + " records, graph holds " +
                              std::to_string(graph->size()));
        }

        return std::unique_ptr<VectorIndex>(new VectorIndex(std::move(graph.value()), std::move(metadata.value())));
    }

}
