#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <cmath>
#include <cstring>
#include <sstream>
#include <algorithm>

namespace orbion {

namespace {

// Blocks buffered between the realtime callback and the delivery thread
constexpr size_t MAX_QUEUED_BLOCKS = 32;

// Delivery thread checks stream liveness when no block arrives within this window
constexpr int CAPTURE_STALL_CHECK_MS = 1000;

int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            LOG_AUDIO(oss.str());
            return default_idx;
        }
        return -1;
    }

    // Try parsing as numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->name != name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            return i;
        }
    }

    return -1;
}

} // anonymous namespace

// =============================================================================
// Capture
// =============================================================================

class PortAudioSource::Impl {
public:
    explicit Impl(const std::string& device_name)
        : device_name_(device_name), stream_(nullptr), pa_initialized_(false),
          sample_rate_(INPUT_SAMPLE_RATE), block_samples_(CAPTURE_BLOCK_SAMPLES),
          running_(false), dropped_blocks_(0) {}

    ~Impl() {
        close();
    }

    Result<void> open(int sample_rate, size_t block_samples) {
        if (stream_) {
            return make_error(ErrorType::InvalidState, "capture device already open");
        }
        sample_rate_ = sample_rate;
        block_samples_ = block_samples;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_capture_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        pa_initialized_ = true;

        int input_idx = find_device(device_name_, true);
        const PaDeviceInfo* input_info = input_idx >= 0 ? Pa_GetDeviceInfo(input_idx) : nullptr;
        if (!input_info || input_info->maxInputChannels == 0) {
            release_library();
            return make_capture_error("No usable input device: " + device_name_);
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name;
        Logger::info(dev_oss.str());

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = AUDIO_CHANNELS;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate_,
                            static_cast<unsigned long>(block_samples_), paClipOff,
                            input_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            release_library();
            return make_capture_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }
        return Result<void>();
    }

    Result<void> start(BlockHandler on_block, DeviceErrorHandler on_error) {
        if (!stream_) {
            return make_error(ErrorType::InvalidState, "capture device not open");
        }
        on_block_ = std::move(on_block);
        on_error_ = std::move(on_error);
        running_ = true;
        delivery_thread_ = std::thread(&Impl::delivery_loop, this);

        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            if (err == paUnanticipatedHostError) {
                err_oss << "; check microphone permissions";
            }
            stop_delivery();
            return make_capture_error(err_oss.str());
        }
        LOG_AUDIO("Capture started (" + std::to_string(block_samples_) + " samples/block @ " +
                  std::to_string(sample_rate_) + " Hz)");
        return Result<void>();
    }

    Result<void> close() {
        Result<void> result;
        // Delivery thread reads stream_, so it goes first
        stop_delivery();

        if (stream_) {
            PaError err = Pa_StopStream(stream_);
            if (err != paNoError && err != paStreamIsStopped) {
                result = make_error(ErrorType::IOError, "Pa_StopStream: " + std::string(Pa_GetErrorText(err)));
            }
            err = Pa_CloseStream(stream_);
            if (err != paNoError) {
                result = make_error(ErrorType::IOError, "Pa_CloseStream: " + std::string(Pa_GetErrorText(err)));
            }
            stream_ = nullptr;
        }

        release_library();

        size_t dropped = dropped_blocks_.exchange(0);
        if (dropped > 0) {
            Logger::warn("Capture dropped " + std::to_string(dropped) + " blocks (delivery too slow)");
        }
        return result;
    }

    bool is_open() const {
        return stream_ != nullptr;
    }

private:
    void stop_delivery() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            running_ = false;
        }
        queue_cv_.notify_all();
        if (delivery_thread_.joinable()) {
            delivery_thread_.join();
        }
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
        on_block_ = nullptr;
        on_error_ = nullptr;
    }

    void release_library() {
        if (pa_initialized_) {
            Pa_Terminate();
            pa_initialized_ = false;
        }
    }

    void delivery_loop() {
        while (running_) {
            AudioFrame frame;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                bool ready = queue_cv_.wait_for(lock, std::chrono::milliseconds(CAPTURE_STALL_CHECK_MS),
                                                [this] { return !queue_.empty() || !running_; });
                if (!running_) {
                    break;
                }
                if (!ready) {
                    lock.unlock();
                    if (stream_ && Pa_IsStreamActive(stream_) != 1) {
                        Logger::error("Capture stream is no longer active");
                        if (on_error_) on_error_("capture device lost");
                        break;
                    }
                    continue;
                }
                frame = std::move(queue_.front());
                queue_.pop_front();
            }
            if (on_block_) {
                on_block_(frame);
            }
        }
    }

    static int input_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        if (!input || !self->running_) {
            return paContinue;
        }

        const Sample* in = static_cast<const Sample*>(input);
        AudioFrame frame(in, in + frame_count);

        {
            std::lock_guard<std::mutex> lock(self->queue_mutex_);
            if (self->queue_.size() < MAX_QUEUED_BLOCKS) {
                self->queue_.push_back(std::move(frame));
            } else {
                self->dropped_blocks_++;
            }
        }
        self->queue_cv_.notify_one();
        return paContinue;
    }

    std::string device_name_;
    PaStream* stream_;
    bool pa_initialized_;
    int sample_rate_;
    size_t block_samples_;

    std::atomic<bool> running_;
    std::atomic<size_t> dropped_blocks_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<AudioFrame> queue_;
    std::thread delivery_thread_;

    BlockHandler on_block_;
    DeviceErrorHandler on_error_;
};

PortAudioSource::PortAudioSource(const std::string& device_name)
    : pimpl_(std::make_unique<Impl>(device_name)) {}
PortAudioSource::~PortAudioSource() = default;

Result<void> PortAudioSource::open(int sample_rate, size_t block_samples) {
    return pimpl_->open(sample_rate, block_samples);
}

Result<void> PortAudioSource::start(BlockHandler on_block, DeviceErrorHandler on_error) {
    return pimpl_->start(std::move(on_block), std::move(on_error));
}

Result<void> PortAudioSource::close() {
    return pimpl_->close();
}

bool PortAudioSource::is_open() const {
    return pimpl_->is_open();
}

// =============================================================================
// Playback
// =============================================================================

class PortAudioSink::Impl {
public:
    explicit Impl(const std::string& device_name)
        : device_name_(device_name), stream_(nullptr), pa_initialized_(false),
          sample_rate_(OUTPUT_SAMPLE_RATE), channels_(AUDIO_CHANNELS),
          frames_rendered_(0), running_(false) {}

    ~Impl() {
        close();
    }

    Result<void> open(int sample_rate, int channels) {
        if (stream_) {
            return make_error(ErrorType::InvalidState, "output device already open");
        }
        sample_rate_ = sample_rate;
        channels_ = std::max(1, channels);
        frames_rendered_ = 0;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_error(ErrorType::OutputUnavailable,
                              "PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        pa_initialized_ = true;

        int output_idx = find_device(device_name_, false);
        const PaDeviceInfo* output_info = output_idx >= 0 ? Pa_GetDeviceInfo(output_idx) : nullptr;
        if (!output_info || output_info->maxOutputChannels == 0) {
            release_library();
            return make_error(ErrorType::OutputUnavailable, "No usable output device: " + device_name_);
        }

        std::ostringstream dev_oss;
        dev_oss << "Using output device: [" << output_idx << "] " << output_info->name;
        Logger::info(dev_oss.str());

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = channels_;
        output_params.sampleFormat = paFloat32;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, nullptr, &output_params, sample_rate_,
                            paFramesPerBufferUnspecified, paClipOff, output_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            release_library();
            return make_error(ErrorType::OutputUnavailable,
                              "Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }

        running_ = true;
        notifier_thread_ = std::thread(&Impl::notifier_loop, this);

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Result<void> closed = close();
            if (!closed) {
                Logger::warn("Output cleanup after failed start: " + closed.error().message);
            }
            return make_error(ErrorType::OutputUnavailable,
                              "Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }
        return Result<void>();
    }

    double now() const {
        return static_cast<double>(frames_rendered_.load()) / sample_rate_;
    }

    Result<void> schedule(BufferHandle handle, std::shared_ptr<const PlaybackBuffer> buffer, double start_at) {
        if (!stream_) {
            return make_error(ErrorType::InvalidState, "output device not open");
        }
        if (!buffer) {
            return make_error(ErrorType::InvalidState, "null playback buffer");
        }
        Scheduled entry;
        entry.handle = handle;
        entry.buffer = std::move(buffer);
        entry.start_frame = static_cast<int64_t>(std::llround(start_at * sample_rate_));

        std::lock_guard<std::mutex> lock(mutex_);
        // Frames already rendered cannot be played; start at the next callback
        entry.start_frame = std::max(entry.start_frame, frames_rendered_.load());
        scheduled_.push_back(std::move(entry));
        return Result<void>();
    }

    void set_completion_handler(CompletionHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        on_complete_ = std::move(handler);
    }

    Result<void> close() {
        Result<void> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        finished_cv_.notify_all();

        if (stream_) {
            PaError err = Pa_StopStream(stream_);
            if (err != paNoError && err != paStreamIsStopped) {
                result = make_error(ErrorType::IOError, "Pa_StopStream: " + std::string(Pa_GetErrorText(err)));
            }
            err = Pa_CloseStream(stream_);
            if (err != paNoError) {
                result = make_error(ErrorType::IOError, "Pa_CloseStream: " + std::string(Pa_GetErrorText(err)));
            }
            stream_ = nullptr;
        }

        if (notifier_thread_.joinable()) {
            notifier_thread_.join();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            scheduled_.clear();
            finished_.clear();
        }
        set_completion_handler(nullptr);
        release_library();
        return result;
    }

    bool is_open() const {
        return stream_ != nullptr;
    }

private:
    struct Scheduled {
        BufferHandle handle = 0;
        std::shared_ptr<const PlaybackBuffer> buffer;
        int64_t start_frame = 0;
    };

    void release_library() {
        if (pa_initialized_) {
            Pa_Terminate();
            pa_initialized_ = false;
        }
    }

    void notifier_loop() {
        while (true) {
            std::vector<BufferHandle> done;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                finished_cv_.wait(lock, [this] { return !finished_.empty() || !running_; });
                if (!running_) {
                    break;
                }
                done.assign(finished_.begin(), finished_.end());
                finished_.clear();
            }

            CompletionHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = on_complete_;
            }
            if (!handler) continue;
            for (BufferHandle handle : done) {
                handler(handle);
            }
        }
    }

    static int output_callback(const void* input, void* output,
                               unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags,
                               void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        float* out = static_cast<float*>(output);
        const int channels = self->channels_;
        std::memset(out, 0, frame_count * channels * sizeof(float));

        bool any_finished = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            const int64_t base = self->frames_rendered_.load();
            const int64_t end = base + static_cast<int64_t>(frame_count);

            for (const auto& entry : self->scheduled_) {
                const auto& samples = entry.buffer->samples;
                const int64_t buf_end = entry.start_frame + static_cast<int64_t>(samples.size());
                const int64_t from = std::max(base, entry.start_frame);
                const int64_t to = std::min(end, buf_end);
                for (int64_t f = from; f < to; ++f) {
                    float s = samples[static_cast<size_t>(f - entry.start_frame)];
                    for (int c = 0; c < channels; ++c) {
                        out[(f - base) * channels + c] += s;
                    }
                }
            }

            auto it = self->scheduled_.begin();
            while (it != self->scheduled_.end()) {
                const int64_t buf_end = it->start_frame + static_cast<int64_t>(it->buffer->samples.size());
                if (buf_end <= end) {
                    self->finished_.push_back(it->handle);
                    it = self->scheduled_.erase(it);
                    any_finished = true;
                } else {
                    ++it;
                }
            }
            self->frames_rendered_.store(end);
        }

        if (any_finished) {
            self->finished_cv_.notify_one();
        }
        return paContinue;
    }

    std::string device_name_;
    PaStream* stream_;
    bool pa_initialized_;
    int sample_rate_;
    int channels_;

    std::atomic<int64_t> frames_rendered_;
    std::atomic<bool> running_;

    std::mutex mutex_;  // scheduled_ and finished_
    std::condition_variable finished_cv_;
    std::vector<Scheduled> scheduled_;
    std::deque<BufferHandle> finished_;
    std::thread notifier_thread_;

    std::mutex handler_mutex_;
    CompletionHandler on_complete_;
};

PortAudioSink::PortAudioSink(const std::string& device_name)
    : pimpl_(std::make_unique<Impl>(device_name)) {}
PortAudioSink::~PortAudioSink() = default;

Result<void> PortAudioSink::open(int sample_rate, int channels) {
    return pimpl_->open(sample_rate, channels);
}

double PortAudioSink::now() const {
    return pimpl_->now();
}

Result<void> PortAudioSink::schedule(BufferHandle handle,
                                     std::shared_ptr<const PlaybackBuffer> buffer,
                                     double start_at) {
    return pimpl_->schedule(handle, std::move(buffer), start_at);
}

void PortAudioSink::set_completion_handler(CompletionHandler handler) {
    pimpl_->set_completion_handler(std::move(handler));
}

Result<void> PortAudioSink::close() {
    return pimpl_->close();
}

bool PortAudioSink::is_open() const {
    return pimpl_->is_open();
}

// =============================================================================
// Device listing
// =============================================================================

namespace audio_devices {

void list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

} // namespace audio_devices

} // namespace orbion
