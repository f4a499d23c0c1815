#pragma once

#include "common.h"
#include "errors.h"

namespace voxgate {

/**
 * @brief Audio segment -> fixed-length speaker embedding
 *
 * Implementations may be slow; the listener bounds every call with a timeout.
 */
class EmbeddingExtractor {
public:
    virtual ~EmbeddingExtractor() = default;

    /**
     * @brief Compute an embedding for a captured segment
     * @return ExtractionError on malformed or too-short audio
     */
    virtual Result<EmbeddingVector> extract(const AudioBuffer& segment) = 0;

    /// Length of every vector returned by extract()
    virtual size_t dimension() const = 0;
};

/**
 * @brief Dependency-free extractor: SHA-256 of each chunk, bytes centered and averaged.
 *
 * Deterministic for identical audio and near-orthogonal for different audio,
 * so it supports enrollment/verification plumbing and tests. It does not
 * model a voice: the same speaker saying something else is rejected too.
 * The listen command refuses it unless
 * verification.allow_placeholder_extractor is set.
 */
class DigestEmbeddingExtractor : public EmbeddingExtractor {
public:
    /**
     * @param length Embedding length (1..32, one SHA-256 byte per dimension)
     * @param chunk_samples Samples hashed per chunk
     * @param min_samples Segments shorter than this fail with ExtractionError
     */
    DigestEmbeddingExtractor(int length, int chunk_samples, int min_samples);

    Result<EmbeddingVector> extract(const AudioBuffer& segment) override;
    size_t dimension() const override { return static_cast<size_t>(length_); }

private:
    int length_;
    int chunk_samples_;
    int min_samples_;
};

} // namespace voxgate
