#pragma once

#include "common.h"
#include "errors.h"
#include <string>

namespace voxgate {

struct VerificationResult {
    bool verified = false;
    float confidence = 0.0f;   ///< Cosine similarity in [-1, 1]
    std::string owner_id;
};

/// Cosine similarity; 0 when either vector has zero norm
float cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b);

/**
 * @brief Thresholded comparison of a live embedding against the enrolled one
 *
 * Pure and deterministic. Does not retry; transient failures are handled by
 * the listener.
 */
class SpeakerVerifier {
public:
    /// No default threshold; the operator must choose one
    explicit SpeakerVerifier(float threshold);

    float threshold() const { return threshold_; }

    /**
     * @brief Compare live against stored
     * @return InvalidArgs on empty vectors or a dimension mismatch
     */
    Result<VerificationResult> verify(const EmbeddingVector& live,
                                      const EmbeddingVector& stored,
                                      const std::string& owner_id) const;

private:
    float threshold_;
};

} // namespace voxgate
