#include "warm_transfer/telephony/audio_stream.hpp"

#include <algorithm>

namespace warm_transfer {

void PlaybackBuffer::push(const std::vector<int16_t>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.insert(samples_.end(), samples.begin(), samples.end());
    if (samples_.size() > capacity_) {
        const auto excess = samples_.size() - capacity_;
        samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(excess));
        dropped_ += excess;
    }
}

std::vector<int16_t> PlaybackBuffer::pop_frame(size_t frame_samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty() || frame_samples == 0) {
        return {};
    }
    const auto take = std::min(frame_samples, samples_.size());
    std::vector<int16_t> frame(samples_.begin(),
                               samples_.begin() + static_cast<std::ptrdiff_t>(take));
    samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(take));
    frame.resize(frame_samples, 0);
    return frame;
}

void PlaybackBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

size_t PlaybackBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

size_t PlaybackBuffer::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

}
