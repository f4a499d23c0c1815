#include "speaker_verifier.h"
#include <algorithm>
#include <cmath>

namespace voxgate {

float cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

SpeakerVerifier::SpeakerVerifier(float threshold) : threshold_(threshold) {}

Result<VerificationResult> SpeakerVerifier::verify(const EmbeddingVector& live,
                                                   const EmbeddingVector& stored,
                                                   const std::string& owner_id) const {
    if (live.empty() || stored.empty()) {
        return make_error(ErrorType::InvalidArgs, "cannot verify an empty embedding");
    }
    if (live.size() != stored.size()) {
        return make_error(ErrorType::InvalidArgs,
                          "embedding dimension mismatch: live " + std::to_string(live.size()) +
                          " vs stored " + std::to_string(stored.size()));
    }

    VerificationResult result;
    result.confidence = cosine_similarity(live, stored);
    result.verified = result.confidence >= threshold_;
    result.owner_id = owner_id;
    return result;
}

} // namespace voxgate
