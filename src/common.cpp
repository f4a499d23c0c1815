#include "common.h"
#include <cmath>

namespace voxgate {

float frame_rms(const AudioBuffer& samples) {
    if (samples.empty()) return 0.0f;

    float sum_sq = 0.0f;
    for (Sample s : samples) {
        float normalized = static_cast<float>(s) / 32768.0f;
        sum_sq += normalized * normalized;
    }

    return std::sqrt(sum_sq / samples.size());
}

} // namespace voxgate
