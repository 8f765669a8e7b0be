#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <pjsua2.hpp>

#include "warm_transfer/telephony/audio_stream.hpp"

namespace warm_transfer {

// Conference bridge port between one call and a speech stream. Frames heard
// on the call are handed to `on_frame` from a worker thread, never from the
// media thread; frames played into the call come from the playback buffer.
class LegMediaPort : public pj::AudioMediaPort {
public:
    LegMediaPort(LegAudioStream::FrameHandler on_frame, size_t playback_capacity);
    ~LegMediaPort() override;

    LegMediaPort(const LegMediaPort&) = delete;
    LegMediaPort& operator=(const LegMediaPort&) = delete;

    void play(const std::vector<int16_t>& samples) { playback_.push(samples); }

    void onFrameRequested(pj::MediaFrame& frame) override;
    void onFrameReceived(pj::MediaFrame& frame) override;

private:
    void worker_loop();

    static constexpr size_t kMaxQueueSize = 64;

    LegAudioStream::FrameHandler on_frame_;
    PlaybackBuffer playback_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::vector<int16_t>> frame_queue_;
    std::thread worker_;
    bool stop_worker_ = false;
};

}
