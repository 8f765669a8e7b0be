#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "warm_transfer/core/types.hpp"

namespace warm_transfer {

// Raw 16-bit mono PCM access to a connected leg, at the provider's clock rate.
class LegAudioStream {
public:
    using FrameHandler = std::function<void(const std::vector<int16_t>&)>;

    virtual ~LegAudioStream() = default;

    // Delivers every frame heard on `leg` to `on_frame` and starts playing
    // samples given to `write_stream`. Throws TelephonyError when the leg has
    // no media.
    virtual void open_stream(const LegId& leg, FrameHandler on_frame) = 0;
    virtual void write_stream(const LegId& leg, const std::vector<int16_t>& samples) = 0;
    virtual void close_stream(const LegId& leg) = 0;
};

// Samples waiting to be played into a leg. Writers append whole chunks; the
// media clock pulls fixed-size frames. The oldest samples are dropped once
// `capacity` is reached.
class PlaybackBuffer {
public:
    explicit PlaybackBuffer(size_t capacity) : capacity_(capacity) {}

    void push(const std::vector<int16_t>& samples);
    // Up to `frame_samples` samples, zero padded to a full frame. Empty when
    // nothing is queued.
    std::vector<int16_t> pop_frame(size_t frame_samples);
    void clear();
    size_t size() const;
    size_t dropped() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<int16_t> samples_;
    size_t dropped_ = 0;
};

}
