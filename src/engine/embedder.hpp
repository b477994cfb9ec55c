#pragma once

#include <string>
#include <vector>
#include <memory>
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    /**
     * @brief Embeddings for a batch plus the input positions they belong to.
     * embeddings[i] was produced from contents[valid_indices[i]].
     */
    struct EncodedBatch {
        std::vector<Embedding> embeddings;
        std::vector<size_t> valid_indices;
    };

    /**
     * @brief Abstract base class for embedding generation.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding for one piece of content.
         * @return The embedding, or EncodingFailed.
         */
        virtual Result<Embedding> encode_one(const ContentRef& content) = 0;

        /**
         * @brief Encodes a batch, skipping items that fail.
         */
        virtual EncodedBatch encode_many(const std::vector<ContentRef>& contents);

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         * 0 until the first successful call when the model does not declare it.
         */
        virtual size_t dimension() const = 0;
    };

    /**
     * @brief Abstract base class for answer generation over retrieved content.
     */
    class Generator {
    public:
        virtual ~Generator() = default;

        /**
         * @brief Answers a query about one retrieved item.
         * @return Generated text, or GenerationFailed.
         */
        virtual Result<std::string> generate(const ContentRef& content, const std::string& query,
                                             const std::string& context) = 0;
    };

    /**
     * @brief Reads the text a content ref stands for (the file body for file refs).
     */
    Result<std::string> read_content_text(const ContentRef& content);

    // True for the raster formats multimodal models accept (case-insensitive extension match).
    bool is_image_file(const std::filesystem::path& path);

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     long timeout_seconds);
    std::unique_ptr<Generator> create_ollama_generator(const std::string& model, const std::string& endpoint,
                                                       long timeout_seconds);

}
