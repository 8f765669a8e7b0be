#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace warm_transfer::utils {

// 16-bit little-endian PCM as carried in websocket binary messages.
std::string to_pcm16le(const std::vector<int16_t>& samples);
// A trailing odd byte is dropped.
std::vector<int16_t> from_pcm16le(const std::string& payload);

}
