#include "warm_transfer/telephony/media_port.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "warm_transfer/logging.hpp"
#include "warm_transfer/telephony/pj_provider.hpp"

namespace warm_transfer {

LegMediaPort::LegMediaPort(LegAudioStream::FrameHandler on_frame, size_t playback_capacity)
    : on_frame_(std::move(on_frame)), playback_(playback_capacity) {
    worker_ = std::thread([this]() { worker_loop(); });
}

LegMediaPort::~LegMediaPort() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_worker_ = true;
    }
    queue_cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void LegMediaPort::onFrameRequested(pj::MediaFrame& frame) {
    frame.type = PJMEDIA_FRAME_TYPE_AUDIO;
    const auto samples = playback_.pop_frame(frame.size / sizeof(int16_t));
    if (samples.empty()) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto bytes = samples.size() * sizeof(int16_t);
    frame.buf.resize(bytes);
    std::memcpy(frame.buf.data(), samples.data(), bytes);
    frame.size = static_cast<unsigned>(bytes);
}

void LegMediaPort::onFrameReceived(pj::MediaFrame& frame) {
    if (frame.buf.empty() || frame.size == 0 || !on_frame_) {
        return;
    }
    const auto available_bytes = std::min(static_cast<size_t>(frame.size), frame.buf.size());
    std::vector<int16_t> samples(available_bytes / sizeof(int16_t));
    std::memcpy(samples.data(), frame.buf.data(), samples.size() * sizeof(int16_t));
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (frame_queue_.size() >= kMaxQueueSize) {
            frame_queue_.pop_front();
        }
        frame_queue_.push_back(std::move(samples));
    }
    queue_cv_.notify_one();
}

void LegMediaPort::worker_loop() {
    ensure_pj_thread_registered("wt_audio");
    while (true) {
        std::vector<int16_t> samples;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stop_worker_ || !frame_queue_.empty(); });
            if (stop_worker_) {
                break;
            }
            samples = std::move(frame_queue_.front());
            frame_queue_.pop_front();
        }
        try {
            on_frame_(samples);
        } catch (const std::exception& ex) {
            logging::warn("Audio frame handler failed", {kv("error", ex.what())});
        }
    }
}

}
