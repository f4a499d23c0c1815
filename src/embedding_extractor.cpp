#include "embedding_extractor.h"
#include <openssl/sha.h>
#include <algorithm>

namespace voxgate {

DigestEmbeddingExtractor::DigestEmbeddingExtractor(int length, int chunk_samples, int min_samples)
    : length_(std::clamp(length, 1, SHA256_DIGEST_LENGTH)),
      chunk_samples_(std::max(1, chunk_samples)),
      min_samples_(std::max(1, min_samples)) {}

Result<EmbeddingVector> DigestEmbeddingExtractor::extract(const AudioBuffer& segment) {
    if (segment.size() < static_cast<size_t>(min_samples_)) {
        return make_error(ErrorType::ExtractionError,
                          "segment too short for extraction (" + std::to_string(segment.size()) +
                          " samples, need " + std::to_string(min_samples_) + ")");
    }

    std::vector<double> accum(static_cast<size_t>(length_), 0.0);
    std::vector<unsigned char> bytes;
    unsigned char digest[SHA256_DIGEST_LENGTH];
    size_t chunks = 0;

    for (size_t start = 0; start < segment.size(); start += static_cast<size_t>(chunk_samples_)) {
        size_t end = std::min(segment.size(), start + static_cast<size_t>(chunk_samples_));
        bytes.clear();
        bytes.reserve((end - start) * 2);
        for (size_t i = start; i < end; ++i) {
            uint16_t s = static_cast<uint16_t>(segment[i]);
            bytes.push_back(static_cast<unsigned char>(s & 0xff));
            bytes.push_back(static_cast<unsigned char>(s >> 8));
        }
        SHA256(bytes.data(), bytes.size(), digest);
        // Centered so unrelated segments land near cosine 0
        for (int i = 0; i < length_; ++i) {
            accum[static_cast<size_t>(i)] += static_cast<double>(digest[i]) - 127.5;
        }
        chunks++;
    }

    EmbeddingVector embedding(static_cast<size_t>(length_));
    for (size_t i = 0; i < embedding.size(); ++i) {
        embedding[i] = static_cast<float>(accum[i] / static_cast<double>(chunks));
    }
    return embedding;
}

} // namespace voxgate
