#pragma once

#include "audio_guardrail.h"
#include "common.h"
#include "config.h"
#include "embedding_extractor.h"
#include "errors.h"
#include "metrics.h"
#include "speaker_verifier.h"
#include "speech_recognizer.h"
#include "verification_token.h"
#include "wake_detector.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace voxgate {

/**
 * @brief Listener lifecycle
 *
 * - Idle / ListeningForWake -> WakeDetected (wake confidence >= wake.threshold)
 * - WakeDetected -> GuardrailCheck (next frame)
 * - GuardrailCheck -> Idle (too much silence before minimum speech)
 * - GuardrailCheck -> Verifying (segment qualifies)
 * - Verifying -> VerifiedActive (accepted) | Cooldown (rejected, timed out, challenge failed)
 * - VerifiedActive -> ListeningForWake (next frame)
 * - Cooldown -> Idle (cooldown elapsed)
 */
enum class ListenerState {
    Idle,
    ListeningForWake,
    WakeDetected,
    GuardrailCheck,
    Verifying,
    VerifiedActive,
    Cooldown
};

const char* listener_state_name(ListenerState state);

/**
 * @brief Audio that passed speaker verification, with its dispatch token
 */
struct VerifiedUtterance {
    std::string owner_id;
    AudioBuffer audio_segment;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int64_t wake_to_verify_latency_ms = 0;
    float confidence = 0.0f;
    VerificationToken token;
};

/**
 * @brief A verification attempt that ended without crossing the trust boundary
 */
struct Rejection {
    ErrorType reason = ErrorType::Unknown;
    std::string message;
    int64_t latency_ms = 0;     ///< Wake to rejection
    int64_t cooldown_ms = 0;    ///< 0 when the listener went straight back to Idle
    float confidence = 0.0f;    ///< Similarity score, when a comparison was made
};

enum class ListenerEventType {
    None,
    WakeIgnored,      ///< Wake event below threshold
    WakeDetected,
    Verified,
    Rejected,
    Suppressed        ///< Frame dropped by cooldown or an in-flight verification
};

struct ListenerEvent {
    ListenerEventType type = ListenerEventType::None;
    std::optional<VerifiedUtterance> utterance;
    std::optional<Rejection> rejection;
};

/**
 * @brief Collaborators the listener drives
 *
 * Shared so bounded calls that outlive a timeout keep them alive.
 * challenge_recognizer is only needed when guardrail.challenge_phrase is set.
 */
struct ListenerDeps {
    std::shared_ptr<WakeDetector> wake_detector;
    std::shared_ptr<EmbeddingExtractor> extractor;
    std::shared_ptr<SpeakerVerifier> verifier;
    std::shared_ptr<TokenAuthority> tokens;
    std::shared_ptr<SpeechRecognizer> challenge_recognizer;
    std::shared_ptr<MetricsSink> metrics;
    EmbeddingVector enrolled_embedding;
    ClockFn clock;
};

/**
 * @brief Frame ingestion -> wake -> guardrail -> verification
 *
 * Owns all per-session state: guardrail accounting, rejection count and
 * cooldown. Frames are handled strictly in arrival order, either directly
 * through process_frame() or through the bounded queue fed by push_frame()
 * and drained by the worker started with start(). Do not mix the two.
 */
class ContinuousListener {
public:
    using VerifiedCallback = std::function<void(const VerifiedUtterance&)>;
    using RejectedCallback = std::function<void(const Rejection&)>;
    using TransitionObserver = std::function<void(ListenerState from, ListenerState to)>;

    ContinuousListener(const Config& config, ListenerDeps deps);
    ~ContinuousListener();

    ContinuousListener(const ContinuousListener&) = delete;
    ContinuousListener& operator=(const ContinuousListener&) = delete;

    /**
     * @brief Handle one frame synchronously
     *
     * Blocks for the duration of a verification attempt (bounded by
     * timeouts.extraction_ms per try, plus the challenge pre-check).
     */
    ListenerEvent process_frame(const AudioFrame& frame);

    /// Spawn the worker that drains the frame queue
    void start(VerifiedCallback on_verified, RejectedCallback on_rejected);

    /// Join the worker; queued frames are discarded
    void stop();

    bool is_running() const;

    /**
     * @brief Enqueue a frame for the worker; never blocks
     * @return false if the queue was full and the frame was dropped
     */
    bool push_frame(AudioFrame frame);

    /// Called on every state change, on the thread that processed the frame
    void set_transition_observer(TransitionObserver observer);

    ListenerState state() const;
    GuardrailState guardrail_state() const;

    /// Rejections counted toward cooldown escalation
    int consecutive_rejections() const;

    /// Cooldown duration that the next rejection would apply
    int64_t next_cooldown_ms() const;

    int64_t frames_dropped() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxgate
