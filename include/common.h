#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <functional>

namespace voxgate {

// Audio types
using Sample = int16_t;
using AudioBuffer = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Time source; injectable so tests can drive cooldowns and token expiry deterministically
using ClockFn = std::function<TimePoint()>;

inline ClockFn steady_clock_fn() {
    return [] { return Clock::now(); };
}

inline int64_t ms_between(TimePoint start, TimePoint end) {
    return std::chrono::duration_cast<Duration>(end - start).count();
}

inline int64_t ms_since(TimePoint start) {
    return ms_between(start, Clock::now());
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (DEFAULT_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 320 samples @ 16kHz

/**
 * @brief Ordered chunk of PCM samples as produced by a capture source.
 *
 * Immutable once produced; the listener owns it only while processing.
 */
struct AudioFrame {
    AudioBuffer samples;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    TimePoint timestamp{};

    int64_t duration_ms() const {
        if (sample_rate <= 0) return 0;
        return static_cast<int64_t>(samples.size()) * 1000 / sample_rate;
    }
};

/// Wake detector output; consumed once by the listener
struct WakeEvent {
    float confidence = 0.0f;
    TimePoint timestamp{};
};

/// Fixed-length speaker embedding
using EmbeddingVector = std::vector<float>;

// Transcript result
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int token_count = 0;  ///< Number of tokens from STT (0 if not set)
    std::string source;   ///< Recognizer that produced it (e.g. "whisper")
};

/// RMS energy of a frame, normalized to [0, 1]
float frame_rms(const AudioBuffer& samples);

} // namespace voxgate
