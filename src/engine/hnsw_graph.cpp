#include "hnsw_graph.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <istream>
#include <limits>
#include <optional>
#include <ostream>
#include <queue>

namespace retina::engine {

    namespace {

        constexpr std::uint32_t kGraphMagic = 0x474E5452;  // "RTNG"
        constexpr std::uint32_t kGraphVersion = 1;
        constexpr int kMaxLevel = 32;

        template <typename T>
        void write_pod(std::ostream& out, const T& value) {
            out.write(reinterpret_cast<const char*>(&value), sizeof(T));
        }

        template <typename T>
        bool read_pod(std::istream& in, T& value) {
            in.read(reinterpret_cast<char*>(&value), sizeof(T));
            return static_cast<bool>(in);
        }

        Error corrupt(const std::string& what) {
            return make_error(ErrorCode::CorruptState, "graph blob: " + what);
        }

        // Bytes between the read position and the end of the stream.
        std::optional<std::uint64_t> remaining_bytes(std::istream& in) {
            const std::streamoff here = in.tellg();
            if (here < 0) return std::nullopt;
            in.seekg(0, std::ios::end);
            const std::streamoff end = in.tellg();
            in.seekg(here);
            if (!in || end < here) return std::nullopt;
            return static_cast<std::uint64_t>(end - here);
        }

    }

    HnswGraph::HnswGraph(const IndexConfig& config)
        : m_config(config),
          m_level_mult(1.0 / std::log(static_cast<double>(std::max<size_t>(config.M, 2)))),
          m_rng(config.random_seed) {}

    int HnswGraph::random_level() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        const double r = 1.0 - dist(m_rng);  // (0, 1]
        const int level = static_cast<int>(-std::log(r) * m_level_mult);
        return std::min(level, kMaxLevel);
    }

    float HnswGraph::distance_to(const float* query, float query_norm, std::uint32_t id) const {
        return engine::distance(m_config.metric, query, query_norm, vector(id), m_norms[id], m_config.dimension);
    }

    float HnswGraph::node_distance(std::uint32_t a, std::uint32_t b) const {
        return engine::distance(m_config.metric, vector(a), m_norms[a], vector(b), m_norms[b], m_config.dimension);
    }

    std::uint64_t HnswGraph::add(const float* vec) {
        const auto id = static_cast<std::uint32_t>(size());
        const size_t dim = m_config.dimension;
        const int level = random_level();

        m_vectors.insert(m_vectors.end(), vec, vec + dim);
        m_norms.push_back(norm(vec, dim));
        m_levels.push_back(level);
        m_links.emplace_back(static_cast<size_t>(level) + 1);

        if (id == 0) {
            m_entry_point = id;
            m_max_level = level;
            return id;
        }

        // m_vectors may have reallocated above, so take the pointer afterwards.
        const float* query = vector(id);
        const float query_norm = m_norms[id];

        std::uint32_t curr = m_entry_point;
        for (int l = m_max_level; l > level; --l) {
            curr = greedy_closest(query, query_norm, curr, l);
        }

        for (int l = std::min(level, m_max_level); l >= 0; --l) {
            auto candidates = search_layer(query, query_norm, curr, m_config.ef_construction, l);
            auto selected = select_neighbors(candidates, m_config.M);

            m_links[id][l] = selected;
            for (std::uint32_t neighbor : selected) {
                connect(neighbor, id, l);
            }
            if (!candidates.empty()) curr = candidates.front().id;
        }

        if (level > m_max_level) {
            m_entry_point = id;
            m_max_level = level;
        }
        return id;
    }

    std::uint32_t HnswGraph::greedy_closest(const float* query, float query_norm, std::uint32_t start, int layer) const {
        std::uint32_t curr = start;
        float curr_dist = distance_to(query, query_norm, curr);

        bool changed = true;
        while (changed) {
            changed = false;
            std::uint32_t best = curr;
            float best_dist = curr_dist;
            for (std::uint32_t neighbor : m_links[curr][layer]) {
                float d = distance_to(query, query_norm, neighbor);
                if (d < best_dist) {
                    best = neighbor;
                    best_dist = d;
                }
            }
            if (best != curr) {
                curr = best;
                curr_dist = best_dist;
                changed = true;
            }
        }
        return curr;
    }

    std::vector<HnswGraph::Candidate> HnswGraph::search_layer(const float* query, float query_norm,
                                                              std::uint32_t start, size_t ef, int layer) const {
        std::vector<char> visited(size(), 0);
        std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> candidates;
        std::priority_queue<Candidate> results;  // worst on top

        Candidate first{distance_to(query, query_norm, start), start};
        candidates.push(first);
        results.push(first);
        visited[start] = 1;

        while (!candidates.empty()) {
            Candidate curr = candidates.top();
            if (results.size() >= ef && curr.distance > results.top().distance) break;
            candidates.pop();

            for (std::uint32_t neighbor : m_links[curr.id][layer]) {
                if (visited[neighbor]) continue;
                visited[neighbor] = 1;

                Candidate next{distance_to(query, query_norm, neighbor), neighbor};
                if (results.size() < ef || next < results.top()) {
                    candidates.push(next);
                    results.push(next);
                    if (results.size() > ef) results.pop();
                }
            }
        }

        std::vector<Candidate> out;
        out.reserve(results.size());
        while (!results.empty()) {
            out.push_back(results.top());
            results.pop();
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    std::vector<std::uint32_t> HnswGraph::select_neighbors(const std::vector<Candidate>& candidates, size_t limit) const {
        // Keep a candidate only if it is closer to the base node than to any
        // neighbor already kept, so links spread out instead of clustering.
        std::vector<std::uint32_t> selected;
        std::vector<std::uint32_t> pruned;
        selected.reserve(limit);

        for (const auto& candidate : candidates) {
            if (selected.size() >= limit) break;
            bool diverse = true;
            for (std::uint32_t kept : selected) {
                if (node_distance(candidate.id, kept) < candidate.distance) {
                    diverse = false;
                    break;
                }
            }
            if (diverse) {
                selected.push_back(candidate.id);
            } else {
                pruned.push_back(candidate.id);
            }
        }

        // Backfill with the closest pruned candidates.
        for (size_t i = 0; i < pruned.size() && selected.size() < limit; ++i) {
            selected.push_back(pruned[i]);
        }
        return selected;
    }

    void HnswGraph::connect(std::uint32_t from, std::uint32_t to, int layer) {
        auto& list = m_links[from][layer];
        if (list.size() < max_links(layer)) {
            list.push_back(to);
            return;
        }

        // Full: replace the weakest link if the new one is strictly closer.
        size_t weakest = 0;
        float weakest_dist = -std::numeric_limits<float>::infinity();
        for (size_t i = 0; i < list.size(); ++i) {
            float d = node_distance(from, list[i]);
            if (d > weakest_dist) {
                weakest = i;
                weakest_dist = d;
            }
        }
        if (node_distance(from, to) < weakest_dist) {
            list[weakest] = to;
        }
    }

    std::vector<Neighbor> HnswGraph::search(const float* query, size_t k) const {
        std::vector<Neighbor> results;
        if (k == 0 || empty()) return results;

        const float query_norm = norm(query, m_config.dimension);

        std::uint32_t curr = m_entry_point;
        for (int l = m_max_level; l > 0; --l) {
            curr = greedy_closest(query, query_norm, curr, l);
        }

        auto candidates = search_layer(query, query_norm, curr, std::max(m_config.ef_search, k), 0);
        if (candidates.size() > k) candidates.resize(k);

        results.reserve(candidates.size());
        for (const auto& c : candidates) {
            results.push_back(Neighbor{c.id, c.distance});
        }
        return results;
    }

    void HnswGraph::serialize(std::ostream& out) const {
        write_pod(out, kGraphMagic);
        write_pod(out, kGraphVersion);
        write_pod(out, static_cast<std::uint64_t>(m_config.dimension));
        write_pod(out, static_cast<std::uint8_t>(m_config.metric));
        write_pod(out, static_cast<std::uint64_t>(m_config.M));
        write_pod(out, static_cast<std::uint64_t>(m_config.ef_construction));
        write_pod(out, static_cast<std::uint64_t>(m_config.ef_search));
        write_pod(out, static_cast<std::uint64_t>(m_config.max_elements));
        write_pod(out, m_config.random_seed);

        write_pod(out, static_cast<std::uint64_t>(size()));
        write_pod(out, m_entry_point);
        write_pod(out, static_cast<std::int32_t>(m_max_level));

        for (size_t id = 0; id < size(); ++id) {
            write_pod(out, static_cast<std::int32_t>(m_levels[id]));
            out.write(reinterpret_cast<const char*>(vector(id)),
                      static_cast<std::streamsize>(m_config.dimension * sizeof(float)));
            for (const auto& layer : m_links[id]) {
                write_pod(out, static_cast<std::uint32_t>(layer.size()));
                if (!layer.empty()) {
                    out.write(reinterpret_cast<const char*>(layer.data()),
                              static_cast<std::streamsize>(layer.size() * sizeof(std::uint32_t)));
                }
            }
        }
    }

    Result<HnswGraph> HnswGraph::deserialize(std::istream& in) {
        std::uint32_t magic = 0, version = 0;
        if (!read_pod(in, magic) || magic != kGraphMagic) return corrupt("bad magic");
        if (!read_pod(in, version) || version != kGraphVersion) return corrupt("unsupported version");

        std::uint64_t dimension = 0, M = 0, ef_construction = 0, ef_search = 0, max_elements = 0;
        std::uint8_t metric = 0;
        IndexConfig config;
        if (!read_pod(in, dimension) || !read_pod(in, metric) || !read_pod(in, M) ||
            !read_pod(in, ef_construction) || !read_pod(in, ef_search) || !read_pod(in, max_elements) ||
            !read_pod(in, config.random_seed)) {
            return corrupt("truncated header");
        }
        if (metric > static_cast<std::uint8_t>(Metric::InnerProduct)) return corrupt("unknown metric");

        config.dimension = dimension;
        config.metric = static_cast<Metric>(metric);
        config.M = M;
        config.ef_construction = ef_construction;
        config.ef_search = ef_search;
        config.max_elements = max_elements;
        if (auto valid = config.validate(); !valid) return corrupt(valid.error().message);

        std::uint64_t count = 0;
        std::uint32_t entry_point = 0;
        std::int32_t max_level = -1;
        if (!read_pod(in, count) || !read_pod(in, entry_point) || !read_pod(in, max_level)) {
            return corrupt("truncated header");
        }
        if (count > config.max_elements) return corrupt("element count exceeds max_elements");
        if (count > 0 && (entry_point >= count || max_level < 0 || max_level > kMaxLevel)) {
            return corrupt("invalid entry point");
        }

        // Each node needs at least its level, its vector and a layer-0 link count,
        // so the blob size bounds count before anything is allocated.
        if (count > 0) {
            auto remaining = remaining_bytes(in);
            if (!remaining) return corrupt("cannot determine blob size");
            if (config.dimension > *remaining / sizeof(float)) return corrupt("dimension exceeds blob size");
            const std::uint64_t min_node_bytes =
                sizeof(std::int32_t) + config.dimension * sizeof(float) + sizeof(std::uint32_t);
            if (count > *remaining / min_node_bytes) return corrupt("element count exceeds blob size");
        }

        HnswGraph graph(config);
        for (std::uint64_t id = 0; id < count; ++id) {
            std::int32_t level = 0;
            if (!read_pod(in, level)) return corrupt("truncated node");
            if (level < 0 || level > max_level) return corrupt("node level out of range");

            const size_t offset = graph.m_vectors.size();
            graph.m_vectors.resize(offset + config.dimension);
            float* dst = graph.m_vectors.data() + offset;
            in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(config.dimension * sizeof(float)));
            if (!in) return corrupt("truncated vector");

            std::vector<std::vector<std::uint32_t>> layers(static_cast<size_t>(level) + 1);
            for (int l = 0; l <= level; ++l) {
                std::uint32_t n = 0;
                if (!read_pod(in, n)) return corrupt("truncated links");
                if (n > graph.max_links(l) || n > count) return corrupt("too many links");
                layers[l].resize(n);
                if (n > 0) {
                    in.read(reinterpret_cast<char*>(layers[l].data()), static_cast<std::streamsize>(n * sizeof(std::uint32_t)));
                    if (!in) return corrupt("truncated links");
                }
            }

            graph.m_norms.push_back(norm(dst, config.dimension));
            graph.m_levels.push_back(level);
            graph.m_links.push_back(std::move(layers));
        }

        // Every link must point at a node that exists on that layer.
        for (std::uint64_t id = 0; id < count; ++id) {
            for (int l = 0; l <= graph.m_levels[id]; ++l) {
                for (std::uint32_t neighbor : graph.m_links[id][l]) {
                    if (neighbor >= count || graph.m_levels[neighbor] < l) return corrupt("dangling link");
                }
            }
        }
        if (count > 0 && graph.m_levels[entry_point] != max_level) return corrupt("entry point level mismatch");

        graph.m_entry_point = entry_point;
        graph.m_max_level = count > 0 ? max_level : -1;
        // Keep level sampling deterministic after a reload.
        graph.m_rng.seed(config.random_seed + static_cast<std::uint32_t>(count));
        return std::move(graph);
    }

}
