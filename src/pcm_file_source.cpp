#include "pcm_file_source.h"
#include "logger.h"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace voxgate {

Result<AudioBuffer> read_pcm_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_io_error("Cannot open audio file: " + path);
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return make_io_error("Failed reading audio file: " + path);
    }
    if (bytes.size() % 2 != 0) {
        return make_parse_error("Audio file is not 16-bit PCM (odd byte count): " + path);
    }

    AudioBuffer samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t lo = bytes[2 * i];
        uint16_t hi = bytes[2 * i + 1];
        samples[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return samples;
}

PcmFileSource::PcmFileSource(std::string path, int sample_rate, int frame_ms)
    : path_(std::move(path)),
      sample_rate_(sample_rate),
      samples_per_frame_(static_cast<size_t>(sample_rate * frame_ms / 1000)) {
    if (samples_per_frame_ == 0) samples_per_frame_ = SAMPLES_PER_FRAME;
}

VoidResult PcmFileSource::open() {
    auto loaded = read_pcm_file(path_);
    if (!loaded) {
        return loaded.error();
    }
    samples_ = std::move(loaded.value());
    cursor_ = 0;
    frames_read_ = 0;
    start_ = Clock::now();
    LOG_AUDIO("Replaying " + path_ + " (" + std::to_string(samples_.size()) + " samples)");
    return {};
}

bool PcmFileSource::read_frame(AudioFrame& frame) {
    if (cursor_ >= samples_.size()) {
        return false;
    }
    size_t take = std::min(samples_per_frame_, samples_.size() - cursor_);
    frame.samples.assign(samples_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                         samples_.begin() + static_cast<std::ptrdiff_t>(cursor_ + take));
    frame.samples.resize(samples_per_frame_, 0);
    frame.sample_rate = sample_rate_;
    frame.timestamp = start_ + std::chrono::milliseconds(
        frames_read_ * static_cast<int64_t>(samples_per_frame_) * 1000 / sample_rate_);
    cursor_ += take;
    frames_read_++;
    return true;
}

size_t PcmFileSource::frames_remaining() const {
    if (cursor_ >= samples_.size()) return 0;
    return (samples_.size() - cursor_ + samples_per_frame_ - 1) / samples_per_frame_;
}

} // namespace voxgate
