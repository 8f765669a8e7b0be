#include "warm_transfer/utils/pcm.hpp"

namespace warm_transfer::utils {

std::string to_pcm16le(const std::vector<int16_t>& samples) {
    std::string payload;
    payload.reserve(samples.size() * 2);
    for (const auto sample : samples) {
        const auto value = static_cast<uint16_t>(sample);
        payload.push_back(static_cast<char>(value & 0xff));
        payload.push_back(static_cast<char>((value >> 8) & 0xff));
    }
    return payload;
}

std::vector<int16_t> from_pcm16le(const std::string& payload) {
    std::vector<int16_t> samples;
    samples.reserve(payload.size() / 2);
    for (size_t i = 0; i + 1 < payload.size(); i += 2) {
        const auto low = static_cast<uint16_t>(static_cast<unsigned char>(payload[i]));
        const auto high = static_cast<uint16_t>(static_cast<unsigned char>(payload[i + 1]));
        samples.push_back(static_cast<int16_t>(low | static_cast<uint16_t>(high << 8)));
    }
    return samples;
}

}
