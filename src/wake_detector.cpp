#include "wake_detector.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace voxgate {

// ---------------------------------------------------------------------------
// EnergyWakeDetector
// ---------------------------------------------------------------------------

EnergyWakeDetector::EnergyWakeDetector(float energy_threshold, int frames_required)
    : energy_threshold_(energy_threshold), frames_required_(std::max(1, frames_required)) {}

std::optional<WakeEvent> EnergyWakeDetector::process(const AudioFrame& frame) {
    float rms = frame_rms(frame.samples);
    if (rms <= energy_threshold_) {
        consecutive_hot_frames_ = 0;
        hot_rms_sum_ = 0.0f;
        return std::nullopt;
    }

    // Debounce: require N consecutive hot frames before firing
    consecutive_hot_frames_++;
    hot_rms_sum_ += rms;
    if (consecutive_hot_frames_ < frames_required_) {
        return std::nullopt;
    }

    float mean_rms = hot_rms_sum_ / static_cast<float>(consecutive_hot_frames_);
    WakeEvent event;
    event.confidence = energy_threshold_ > 0.0f
        ? std::clamp(mean_rms / (2.0f * energy_threshold_), 0.0f, 1.0f)
        : 1.0f;
    event.timestamp = frame.timestamp;
    reset();
    return event;
}

void EnergyWakeDetector::reset() {
    consecutive_hot_frames_ = 0;
    hot_rms_sum_ = 0.0f;
}

// ---------------------------------------------------------------------------
// UdpWakeDetector
// ---------------------------------------------------------------------------

UdpWakeDetector::UdpWakeDetector(std::string bind_ip, int port)
    : bind_ip_(std::move(bind_ip)), port_(port) {}

UdpWakeDetector::~UdpWakeDetector() { stop(); }

VoidResult UdpWakeDetector::start() {
    if (running_.load()) return {};

    sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) {
        return make_error(ErrorType::NetworkError, std::string("wake socket() failed: ") + std::strerror(errno));
    }

    int reuse = 1;
    ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // Short receive timeout so the thread notices stop() promptly
    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 200 * 1000;
    ::setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        ::close(sock_);
        sock_ = -1;
        return make_error(ErrorType::ConfigError, "invalid wake bind ip: " + bind_ip_);
    }
    if (::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        ::close(sock_);
        sock_ = -1;
        return make_error(ErrorType::NetworkError,
                          "wake bind() to " + bind_ip_ + ":" + std::to_string(port_) + " failed: " + reason);
    }

    running_ = true;
    thread_ = std::thread(&UdpWakeDetector::run, this);
    LOG_WAKE("Listening for wake datagrams on " + bind_ip_ + ":" + std::to_string(port_));
    return {};
}

void UdpWakeDetector::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

void UdpWakeDetector::run() {
    char buff[2048];
    while (running_.load()) {
        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(sock_, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            Logger::error(std::string("[Wake] recvfrom failed: ") + std::strerror(errno));
            break;
        }
        buff[n] = '\0';

        float confidence = parse_confidence(std::string(buff, static_cast<size_t>(n)));
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_confidence_ = confidence;
    }
}

std::optional<WakeEvent> UdpWakeDetector::process(const AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!pending_confidence_) {
        return std::nullopt;
    }
    WakeEvent event;
    event.confidence = *pending_confidence_;
    event.timestamp = frame.timestamp;
    pending_confidence_.reset();
    return event;
}

void UdpWakeDetector::reset() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_confidence_.reset();
}

float UdpWakeDetector::parse_confidence(const std::string& payload) {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_object() && j.contains("confidence") && j["confidence"].is_number()) {
        return std::clamp(j["confidence"].get<float>(), 0.0f, 1.0f);
    }
    if (j.is_number()) {
        return std::clamp(j.get<float>(), 0.0f, 1.0f);
    }
    return 1.0f;
}

} // namespace voxgate
