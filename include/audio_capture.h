#pragma once

#include "common.h"
#include "errors.h"
#include "frame_source.h"
#include <memory>
#include <string>

namespace voxgate {

/**
 * @brief Microphone capture using PortAudio (mono, 16-bit)
 *
 * read_frame() blocks until one frame of frame_ms is available.
 */
class AudioCapture : public FrameSource {
public:
    AudioCapture();
    ~AudioCapture() override;

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief Open and start the input stream
     * @param input_device Device name, numeric index, or "default"
     * @return IOError if PortAudio or the device cannot be opened
     */
    VoidResult start(const std::string& input_device, int sample_rate, int frame_ms);

    bool read_frame(AudioFrame& frame) override;
    int sample_rate() const override;

    void stop();

    /**
     * @brief List all available capture devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxgate
