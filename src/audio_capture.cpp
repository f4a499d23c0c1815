#include "audio_capture.h"
#include "logger.h"
#include <portaudio.h>
#include <sstream>

namespace voxgate {

class AudioCapture::Impl {
public:
    Impl() : stream_(nullptr), initialized_(false), sample_rate_(DEFAULT_SAMPLE_RATE),
             samples_per_frame_(SAMPLES_PER_FRAME) {}

    ~Impl() {
        stop();
    }

    VoidResult start(const std::string& input_device, int sample_rate, int frame_ms) {
        if (stream_) return {};

        sample_rate_ = sample_rate;
        samples_per_frame_ = sample_rate * frame_ms / 1000;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_io_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        initialized_ = true;

        int input_idx = find_device(input_device);
        if (input_idx < 0) {
            stop();
            return make_io_error("Input device not found: " + input_device);
        }
        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        if (!input_info || input_info->maxInputChannels <= 0) {
            stop();
            return make_io_error("Device reports no input channels: " + input_device);
        }

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate_,
                            static_cast<unsigned long>(samples_per_frame_), paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            stop();
            return make_io_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::string reason = Pa_GetErrorText(err);
            stop();
            return make_io_error("Failed to start input stream: " + reason);
        }

        std::ostringstream oss;
        oss << "Capturing from [" << input_idx << "] " << input_info->name << " at " << sample_rate_
            << " Hz, " << frame_ms << " ms frames";
        Logger::info(oss.str());
        return {};
    }

    bool read_frame(AudioFrame& frame) {
        if (!stream_) return false;

        frame.samples.resize(static_cast<size_t>(samples_per_frame_));
        frame.sample_rate = sample_rate_;
        PaError err = Pa_ReadStream(stream_, frame.samples.data(), static_cast<unsigned long>(samples_per_frame_));
        frame.timestamp = Clock::now();

        if (err == paInputOverflowed) {
            LOG_AUDIO("Input overflow");
        } else if (err != paNoError) {
            Logger::error("Pa_ReadStream failed: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        return true;
    }

    int sample_rate() const { return sample_rate_; }

    void stop() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available capture devices:");
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || info->maxInputChannels <= 0) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name << " (IN:" << info->maxInputChannels
                << ", default rate " << info->defaultSampleRate << ")";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    int find_device(const std::string& name) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = Pa_GetDefaultInputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        // Numeric device index
        try {
            size_t used = 0;
            int device_idx = std::stoi(name, &used);
            if (used == name.size() && device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, continue to name matching
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->name == name) {
                return i;
            }
        }
        return -1;
    }

    PaStream* stream_;
    bool initialized_;
    int sample_rate_;
    int samples_per_frame_;
};

AudioCapture::AudioCapture() : pimpl_(std::make_unique<Impl>()) {}

AudioCapture::~AudioCapture() = default;

VoidResult AudioCapture::start(const std::string& input_device, int sample_rate, int frame_ms) {
    return pimpl_->start(input_device, sample_rate, frame_ms);
}

bool AudioCapture::read_frame(AudioFrame& frame) {
    return pimpl_->read_frame(frame);
}

int AudioCapture::sample_rate() const {
    return pimpl_->sample_rate();
}

void AudioCapture::stop() {
    pimpl_->stop();
}

void AudioCapture::list_devices() {
    Impl::list_devices();
}

} // namespace voxgate
