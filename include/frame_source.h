#pragma once

#include "common.h"

namespace voxgate {

/**
 * @brief Anything that produces audio frames in order (microphone, file)
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Read the next frame
     * @return false at end of stream or on a fatal device error
     */
    virtual bool read_frame(AudioFrame& frame) = 0;

    virtual int sample_rate() const = 0;
};

} // namespace voxgate
