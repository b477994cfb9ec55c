#include "embedder.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>

namespace retina::engine {

    namespace {
        const std::array<const char*, 6> kImageExtensions = {".jpg", ".jpeg", ".png", ".bmp", ".tiff", ".webp"};
    }

    EncodedBatch Embedder::encode_many(const std::vector<ContentRef>& contents) {
        EncodedBatch batch;
        for (size_t i = 0; i < contents.size(); ++i) {
            Result<Embedding> embedding = make_error(ErrorCode::EncodingFailed, "not encoded");
            try {
                embedding = encode_one(contents[i]);
            } catch (const std::exception& e) {
                embedding = make_error(ErrorCode::EncodingFailed, e.what());
            }
            if (!embedding) {
                std::cerr << "[Embedder] Skipping " << contents[i].describe() << ": " << embedding.error().describe() << "\n";
                continue;
            }
            batch.embeddings.push_back(std::move(embedding.value()));
            batch.valid_indices.push_back(i);
        }
        return batch;
    }

    Result<std::string> read_content_text(const ContentRef& content) {
        if (content.kind == ContentRef::Kind::Text) return content.text;

        std::ifstream f(content.path, std::ios::binary);
        if (!f) return make_error(ErrorCode::NotFound, "cannot read " + content.path.string());
        std::stringstream buffer;
        buffer << f.rdbuf();
        return buffer.str();
    }

    bool is_image_file(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
        return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) != kImageExtensions.end();
    }

}
