#pragma once

#include <cstdint>
#include <iosfwd>
#include <random>
#include <vector>
#include "index_config.hpp"
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    /**
     * @brief Hierarchical Navigable Small World graph.
     *
     * Layer 0 holds every node; each higher layer holds an exponentially
     * shrinking random subset and acts as an express lane for the greedy
     * descent. Node ids are dense (0..size-1) and double as the public item
     * ids. Vectors are stored in one flat array.
     *
     * Not synchronized; VectorIndex owns the locking.
     */
    class HnswGraph {
    public:
        explicit HnswGraph(const IndexConfig& config);

        const IndexConfig& config() const { return m_config; }
        size_t size() const { return m_levels.size(); }
        bool empty() const { return m_levels.empty(); }
        int max_level() const { return m_max_level; }
        std::uint32_t entry_point() const { return m_entry_point; }

        /**
         * @brief Links a new vector into the graph.
         * The caller has already checked dimension and capacity.
         * @return The id of the new node.
         */
        std::uint64_t add(const float* vec);

        /**
         * @brief Approximate k nearest neighbors, ascending by (distance, id).
         * Uses breadth max(ef_search, k) at layer 0.
         */
        std::vector<Neighbor> search(const float* query, size_t k) const;

        const float* vector(std::uint64_t id) const { return m_vectors.data() + id * m_config.dimension; }
        int level(std::uint64_t id) const { return m_levels[id]; }
        const std::vector<std::uint32_t>& links(std::uint64_t id, int layer) const { return m_links[id][layer]; }

        /**
         * @brief Writes the header, vectors and adjacency lists.
         */
        void serialize(std::ostream& out) const;

        /**
         * @brief Reads a graph written by serialize().
         * Truncated or inconsistent input yields CorruptState.
         */
        static Result<HnswGraph> deserialize(std::istream& in);

    private:
        struct Candidate {
            float distance;
            std::uint32_t id;

            bool operator<(const Candidate& o) const {
                return distance < o.distance || (distance == o.distance && id < o.id);
            }
            bool operator>(const Candidate& o) const { return o < *this; }
        };

        size_t max_links(int layer) const { return layer == 0 ? m_config.M * 2 : m_config.M; }
        int random_level();

        float distance_to(const float* query, float query_norm, std::uint32_t id) const;
        float node_distance(std::uint32_t a, std::uint32_t b) const;

        std::uint32_t greedy_closest(const float* query, float query_norm, std::uint32_t start, int layer) const;
        std::vector<Candidate> search_layer(const float* query, float query_norm, std::uint32_t start,
                                            size_t ef, int layer) const;
        std::vector<std::uint32_t> select_neighbors(const std::vector<Candidate>& candidates, size_t limit) const;
        void connect(std::uint32_t from, std::uint32_t to, int layer);

        IndexConfig m_config;
        double m_level_mult;

        std::vector<float> m_vectors;  // [size * dimension]
        std::vector<float> m_norms;
        std::vector<int> m_levels;
        std::vector<std::vector<std::vector<std::uint32_t>>> m_links;  // [node][layer] -> neighbors

        std::uint32_t m_entry_point = 0;
        int m_max_level = -1;
        std::mt19937 m_rng;
    };

}
