#include "continuous_listener.h"
#include "frame_queue.h"
#include "logger.h"
#include "timeout.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace voxgate {

const char* listener_state_name(ListenerState state) {
    switch (state) {
        case ListenerState::Idle: return "Idle";
        case ListenerState::ListeningForWake: return "ListeningForWake";
        case ListenerState::WakeDetected: return "WakeDetected";
        case ListenerState::GuardrailCheck: return "GuardrailCheck";
        case ListenerState::Verifying: return "Verifying";
        case ListenerState::VerifiedActive: return "VerifiedActive";
        case ListenerState::Cooldown: return "Cooldown";
    }
    return "Unknown";
}

class ContinuousListener::Impl {
public:
    Impl(const Config& config, ListenerDeps deps)
        : wake_config_(config.wake),
          cooldown_config_(config.cooldown),
          timeouts_(config.timeouts),
          owner_id_(config.verification.owner_id),
          queue_capacity_(config.audio.frame_queue_capacity),
          deps_(std::move(deps)),
          guardrail_(config.guardrail),
          queue_(config.audio.frame_queue_capacity) {
        if (!deps_.wake_detector || !deps_.extractor || !deps_.verifier || !deps_.tokens) {
            throw std::invalid_argument("ContinuousListener requires wake detector, extractor, verifier and token authority");
        }
        if (guardrail_.has_challenge() && !deps_.challenge_recognizer) {
            throw std::invalid_argument("challenge phrase configured without a recognizer");
        }
        if (!deps_.metrics) deps_.metrics = std::make_shared<NullMetrics>();
        if (!deps_.clock) deps_.clock = steady_clock_fn();
    }

    ~Impl() { stop(); }

    ListenerEvent process_frame(const AudioFrame& frame) {
        std::unique_lock<std::mutex> lock(process_mutex_, std::try_to_lock);
        if (!lock.owns_lock()) {
            // Another frame is mid-verification; only one attempt may be in flight
            ListenerEvent event;
            event.type = ListenerEventType::Suppressed;
            return event;
        }

        ListenerEvent event = handle_frame(frame);
        {
            std::lock_guard<std::mutex> snap(snapshot_mutex_);
            guardrail_snapshot_ = guardrail_.state();
        }
        return event;
    }

    void start(VerifiedCallback on_verified, RejectedCallback on_rejected) {
        if (running_.exchange(true)) return;
        on_verified_ = std::move(on_verified);
        on_rejected_ = std::move(on_rejected);
        worker_ = std::thread(&Impl::worker_loop, this);
        LOG_LISTENER("Worker started (queue capacity " + std::to_string(queue_capacity_) + ")");
    }

    void stop() {
        if (!running_.exchange(false)) return;
        if (worker_.joinable()) worker_.join();
        queue_.clear();
        LOG_LISTENER("Worker stopped");
    }

    bool is_running() const { return running_.load(); }

    bool push_frame(AudioFrame frame) {
        if (queue_.push(std::move(frame))) {
            return true;
        }
        frames_dropped_.fetch_add(1);
        deps_.metrics->increment("frames_dropped");
        return false;
    }

    void set_transition_observer(TransitionObserver observer) {
        observer_ = std::move(observer);
    }

    ListenerState state() const { return state_.load(); }

    GuardrailState guardrail_state() const {
        std::lock_guard<std::mutex> snap(snapshot_mutex_);
        return guardrail_snapshot_;
    }

    int consecutive_rejections() const { return rejection_count_.load(); }

    int64_t next_cooldown_ms() const {
        return cooldown_for(rejection_count_.load() + 1);
    }

    int64_t frames_dropped() const { return frames_dropped_.load(); }

private:
    ListenerEvent handle_frame(const AudioFrame& frame) {
        TimePoint now = deps_.clock();
        ListenerEvent event;

        switch (state_.load()) {
            case ListenerState::Cooldown:
                if (now < cooldown_until_) {
                    event.type = ListenerEventType::Suppressed;
                    return event;
                }
                LOG_LISTENER("Cooldown elapsed");
                set_state(ListenerState::Idle);
                return listen_for_wake(frame, now);

            case ListenerState::Idle:
            case ListenerState::ListeningForWake:
            case ListenerState::VerifiedActive:
                return listen_for_wake(frame, now);

            case ListenerState::WakeDetected:
                set_state(ListenerState::GuardrailCheck);
                return check_guardrail(frame, now);

            case ListenerState::GuardrailCheck:
                return check_guardrail(frame, now);

            case ListenerState::Verifying:
                // Not reachable while process_mutex_ is held by the verifying frame
                event.type = ListenerEventType::Suppressed;
                return event;
        }
        return event;
    }

    ListenerEvent listen_for_wake(const AudioFrame& frame, TimePoint now) {
        if (state_.load() != ListenerState::ListeningForWake) {
            set_state(ListenerState::ListeningForWake);
        }

        ListenerEvent event;
        std::optional<WakeEvent> wake = deps_.wake_detector->process(frame);
        if (!wake) {
            return event;
        }

        if (wake->confidence < wake_config_.threshold) {
            deps_.metrics->increment("wake_ignored");
            std::ostringstream oss;
            oss << "Wake confidence " << wake->confidence << " below threshold " << wake_config_.threshold;
            LOG_WAKE(oss.str());
            event.type = ListenerEventType::WakeIgnored;
            return event;
        }

        attempt_id_++;
        wake_time_ = now;
        guardrail_.reset();
        deps_.metrics->increment("wake_detected");
        std::ostringstream oss;
        oss << "confidence=" << wake->confidence;
        LOG_TRACE(attempt_id_, "wake", oss.str());
        set_state(ListenerState::WakeDetected);
        event.type = ListenerEventType::WakeDetected;
        return event;
    }

    ListenerEvent check_guardrail(const AudioFrame& frame, TimePoint now) {
        ListenerEvent event;
        GuardrailStatus status = guardrail_.process(frame);

        if (status == GuardrailStatus::Accumulating) {
            return event;
        }
        if (status == GuardrailStatus::Rejected) {
            std::string reason = guardrail_.rejection_reason();
            guardrail_.reset();
            deps_.metrics->increment("guardrail_rejected");
            return reject(ErrorType::GuardrailRejected, reason, now, false);
        }

        set_state(ListenerState::Verifying);
        return verify_segment(guardrail_.take_segment(), frame.sample_rate);
    }

    ListenerEvent verify_segment(AudioBuffer segment, int sample_rate) {
        auto shared_segment = std::make_shared<const AudioBuffer>(std::move(segment));
        LOG_TRACE(attempt_id_, "verify",
                  "samples=" + std::to_string(shared_segment->size()));

        if (guardrail_.has_challenge()) {
            auto recognizer = deps_.challenge_recognizer;
            auto transcript = call_with_timeout<Transcript>(
                [recognizer, shared_segment, sample_rate]() {
                    return recognizer->transcribe(*shared_segment, sample_rate);
                },
                timeouts_.asr_ms, "challenge transcription");
            if (!transcript) {
                if (transcript.error_type() == ErrorType::Timeout) {
                    deps_.metrics->increment("verification_timeout");
                    return reject(ErrorType::Timeout, transcript.error().message, deps_.clock(), true);
                }
                deps_.metrics->increment("guardrail_rejected");
                return reject(ErrorType::GuardrailRejected,
                              "challenge pre-check failed: " + transcript.error().message,
                              deps_.clock(), true);
            }
            auto challenge = guardrail_.check_challenge(transcript.value().text);
            if (!challenge) {
                deps_.metrics->increment("guardrail_rejected");
                return reject(ErrorType::GuardrailRejected, challenge.error().message, deps_.clock(), true);
            }
        }

        auto extractor = deps_.extractor;
        Result<EmbeddingVector> live = make_error(ErrorType::Unknown, "extraction not attempted");
        for (int attempt = 0; attempt <= timeouts_.transient_retries; ++attempt) {
            live = call_with_timeout<EmbeddingVector>(
                [extractor, shared_segment]() { return extractor->extract(*shared_segment); },
                timeouts_.extraction_ms, "embedding extraction", ErrorType::ExtractionError);
            if (live || !is_transient(live.error_type())) {
                break;
            }
            if (attempt < timeouts_.transient_retries) {
                Logger::warn("[Verify] " + live.error().message + "; retrying once");
            }
        }

        if (!live) {
            if (live.error_type() == ErrorType::Timeout) {
                deps_.metrics->increment("verification_timeout");
            }
            return reject(live.error_type(), live.error().message, deps_.clock(), true);
        }

        auto result = deps_.verifier->verify(live.value(), deps_.enrolled_embedding, owner_id_);
        if (!result) {
            return reject(result.error_type(), result.error().message, deps_.clock(), true);
        }

        const VerificationResult& vr = result.value();
        if (!vr.verified) {
            deps_.metrics->increment("speaker_rejected");
            std::ostringstream oss;
            oss << "similarity " << vr.confidence << " below threshold " << deps_.verifier->threshold();
            return reject(ErrorType::VerificationRejected, oss.str(), deps_.clock(), true, vr.confidence);
        }

        auto token = deps_.tokens->issue(vr.owner_id);
        if (!token) {
            return reject(token.error_type(), token.error().message, deps_.clock(), true, vr.confidence);
        }

        TimePoint verified_at = deps_.clock();
        int64_t latency = ms_between(wake_time_, verified_at);
        deps_.metrics->increment("speaker_verified");
        deps_.metrics->record("wake_to_verify_ms", static_cast<double>(latency));

        rejection_count_ = 0;
        has_last_rejection_ = false;
        wake_detector_reset();
        set_state(ListenerState::VerifiedActive);

        std::ostringstream oss;
        oss << "owner=" << vr.owner_id << " score=" << vr.confidence << " latency_ms=" << latency;
        LOG_TRACE(attempt_id_, "verified", oss.str());

        VerifiedUtterance utterance;
        utterance.owner_id = vr.owner_id;
        utterance.audio_segment = *shared_segment;
        utterance.sample_rate = sample_rate;
        utterance.wake_to_verify_latency_ms = latency;
        utterance.confidence = vr.confidence;
        utterance.token = token.value();

        ListenerEvent event;
        event.type = ListenerEventType::Verified;
        event.utterance = std::move(utterance);
        return event;
    }

    ListenerEvent reject(ErrorType reason, const std::string& message, TimePoint now,
                         bool enter_cooldown, float confidence = 0.0f) {
        Rejection rejection;
        rejection.reason = reason;
        rejection.message = message;
        rejection.latency_ms = ms_between(wake_time_, now);
        rejection.confidence = confidence;

        deps_.metrics->record("rejection_latency_ms", static_cast<double>(rejection.latency_ms),
                              {{"reason", error_type_name(reason)}});

        guardrail_.reset();
        wake_detector_reset();

        if (enter_cooldown) {
            if (has_last_rejection_ &&
                ms_between(last_rejection_, now) <= cooldown_config_.rejection_window_ms) {
                rejection_count_++;
            } else {
                rejection_count_ = 1;
            }
            last_rejection_ = now;
            has_last_rejection_ = true;

            rejection.cooldown_ms = cooldown_for(rejection_count_.load());
            cooldown_until_ = now + std::chrono::milliseconds(rejection.cooldown_ms);
            deps_.metrics->record("cooldown_ms", static_cast<double>(rejection.cooldown_ms));
            set_state(ListenerState::Cooldown);
        } else {
            set_state(ListenerState::Idle);
        }

        std::string data = std::string("reason=") + error_type_name(reason) +
                           " cooldown_ms=" + std::to_string(rejection.cooldown_ms) + " " + message;
        LOG_TRACE(attempt_id_, "rejected", data);
        if (is_security_error(reason)) {
            Logger::error("[Listener] Security rejection: " + message);
        }

        ListenerEvent event;
        event.type = ListenerEventType::Rejected;
        event.rejection = std::move(rejection);
        return event;
    }

    /// base_ms, doubled for each rejection at or beyond escalate_after, capped at max_ms
    int64_t cooldown_for(int rejections) const {
        int64_t duration = cooldown_config_.base_ms;
        for (int n = cooldown_config_.escalate_after; n <= rejections; ++n) {
            duration *= 2;
            if (duration >= cooldown_config_.max_ms) {
                return cooldown_config_.max_ms;
            }
        }
        return std::min<int64_t>(duration, cooldown_config_.max_ms);
    }

    void wake_detector_reset() {
        deps_.wake_detector->reset();
    }

    void set_state(ListenerState next) {
        ListenerState prev = state_.exchange(next);
        if (prev == next) return;
        Logger::debug(std::string("[Listener] ") + listener_state_name(prev) + " -> " + listener_state_name(next));
        if (observer_) {
            observer_(prev, next);
        }
    }

    void worker_loop() {
        AudioFrame frame;
        while (running_.load()) {
            if (!queue_.pop(frame)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }

            ListenerEvent event = process_frame(frame);
            try {
                if (event.type == ListenerEventType::Verified && event.utterance && on_verified_) {
                    on_verified_(*event.utterance);
                } else if (event.type == ListenerEventType::Rejected && event.rejection && on_rejected_) {
                    on_rejected_(*event.rejection);
                }
            } catch (const std::exception& e) {
                Logger::error(std::string("[Listener] Callback threw: ") + e.what());
            }
        }
    }

    WakeConfig wake_config_;
    CooldownConfig cooldown_config_;
    TimeoutsConfig timeouts_;
    std::string owner_id_;
    size_t queue_capacity_;
    ListenerDeps deps_;

    AudioGuardrail guardrail_;
    std::atomic<ListenerState> state_{ListenerState::Idle};
    TimePoint wake_time_{};
    TimePoint cooldown_until_{};
    TimePoint last_rejection_{};
    bool has_last_rejection_ = false;
    std::atomic<int> rejection_count_{0};
    int64_t attempt_id_ = 0;

    std::mutex process_mutex_;
    mutable std::mutex snapshot_mutex_;
    GuardrailState guardrail_snapshot_;

    FrameQueue queue_;
    std::atomic<int64_t> frames_dropped_{0};
    std::atomic<bool> running_{false};
    std::thread worker_;
    VerifiedCallback on_verified_;
    RejectedCallback on_rejected_;
    TransitionObserver observer_;
};

ContinuousListener::ContinuousListener(const Config& config, ListenerDeps deps)
    : pimpl_(std::make_unique<Impl>(config, std::move(deps))) {}

ContinuousListener::~ContinuousListener() = default;

ListenerEvent ContinuousListener::process_frame(const AudioFrame& frame) {
    return pimpl_->process_frame(frame);
}

void ContinuousListener::start(VerifiedCallback on_verified, RejectedCallback on_rejected) {
    pimpl_->start(std::move(on_verified), std::move(on_rejected));
}

void ContinuousListener::stop() {
    pimpl_->stop();
}

bool ContinuousListener::is_running() const {
    return pimpl_->is_running();
}

bool ContinuousListener::push_frame(AudioFrame frame) {
    return pimpl_->push_frame(std::move(frame));
}

void ContinuousListener::set_transition_observer(TransitionObserver observer) {
    pimpl_->set_transition_observer(std::move(observer));
}

ListenerState ContinuousListener::state() const {
    return pimpl_->state();
}

GuardrailState ContinuousListener::guardrail_state() const {
    return pimpl_->guardrail_state();
}

int ContinuousListener::consecutive_rejections() const {
    return pimpl_->consecutive_rejections();
}

int64_t ContinuousListener::next_cooldown_ms() const {
    return pimpl_->next_cooldown_ms();
}

int64_t ContinuousListener::frames_dropped() const {
    return pimpl_->frames_dropped();
}

} // namespace voxgate
