#pragma once

#include "common.h"
#include "errors.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace voxgate {

/**
 * @brief Wake-word capability: frames in, occasional WakeEvent out
 */
class WakeDetector {
public:
    virtual ~WakeDetector() = default;

    virtual std::optional<WakeEvent> process(const AudioFrame& frame) = 0;

    /// Drop any partial detection state (called after each attempt ends)
    virtual void reset() {}
};

/**
 * @brief Fires after N consecutive frames above an RMS threshold
 *
 * Confidence is the mean RMS of the hot run relative to twice the threshold,
 * clamped to [0, 1]: a run barely over the threshold yields ~0.5 and is
 * normally ignored by the listener's wake threshold.
 */
class EnergyWakeDetector : public WakeDetector {
public:
    EnergyWakeDetector(float energy_threshold, int frames_required);

    std::optional<WakeEvent> process(const AudioFrame& frame) override;
    void reset() override;

private:
    float energy_threshold_;
    int frames_required_;
    int consecutive_hot_frames_ = 0;
    float hot_rms_sum_ = 0.0f;
};

/**
 * @brief Wake events delivered as UDP datagrams from an external wake-word process
 *
 * A background thread receives datagrams on bind_ip:port. The payload is
 * either a bare confidence ("0.93"), a JSON object with a "confidence" field,
 * or anything else (treated as confidence 1.0). The most recent pending
 * event is returned by the next process() call.
 */
class UdpWakeDetector : public WakeDetector {
public:
    UdpWakeDetector(std::string bind_ip, int port);
    ~UdpWakeDetector() override;

    UdpWakeDetector(const UdpWakeDetector&) = delete;
    UdpWakeDetector& operator=(const UdpWakeDetector&) = delete;

    /// Bind the socket and start the receive thread
    VoidResult start();
    void stop();

    std::optional<WakeEvent> process(const AudioFrame& frame) override;
    void reset() override;

    /// Payload -> confidence, exposed for tests
    static float parse_confidence(const std::string& payload);

private:
    void run();

    std::string bind_ip_;
    int port_;
    int sock_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::mutex pending_mutex_;
    std::optional<float> pending_confidence_;
};

} // namespace voxgate
