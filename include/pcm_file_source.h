#pragma once

#include "common.h"
#include "errors.h"
#include "frame_source.h"
#include <string>

namespace voxgate {

/**
 * @brief Read a headerless little-endian 16-bit mono PCM file
 * @return IOError if the file cannot be read, ParseError on an odd byte count
 */
Result<AudioBuffer> read_pcm_file(const std::string& path);

/**
 * @brief Replays a raw PCM file as fixed-size frames
 *
 * Used for enrollment recordings and offline runs of the listener. Timestamps
 * advance by one frame duration per frame from the moment open() succeeds.
 * A trailing partial frame is zero padded.
 */
class PcmFileSource : public FrameSource {
public:
    PcmFileSource(std::string path, int sample_rate, int frame_ms);

    VoidResult open();

    bool read_frame(AudioFrame& frame) override;
    int sample_rate() const override { return sample_rate_; }

    size_t frames_remaining() const;

private:
    std::string path_;
    int sample_rate_;
    size_t samples_per_frame_;
    AudioBuffer samples_;
    size_t cursor_ = 0;
    TimePoint start_{};
    int64_t frames_read_ = 0;
};

} // namespace voxgate
