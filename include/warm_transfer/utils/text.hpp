#pragma once

#include <optional>
#include <string>
#include <vector>

namespace warm_transfer::utils {

// Lowercases, folds punctuation and whitespace runs into single spaces.
std::string normalize_text(const std::string& text);

// Whole-word phrase match on normalized text.
bool contains_phrase(const std::string& text, const std::string& phrase);

std::optional<std::string> find_phone_number(const std::string& text);

// Drops emoji and markup characters a TTS engine would read out literally.
std::string sanitize_for_speech(const std::string& text);

std::string join(const std::vector<std::string>& items, const std::string& separator);

}
