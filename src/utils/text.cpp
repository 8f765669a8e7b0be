#include "warm_transfer/utils/text.hpp"

#include <cctype>
#include <cstdint>
#include <regex>

namespace warm_transfer::utils {

namespace {

bool is_pictograph(uint32_t codepoint) {
    return (codepoint >= 0x1F000 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2600 && codepoint <= 0x27BF) ||
           (codepoint >= 0xFE00 && codepoint <= 0xFE0F) ||
           codepoint == 0x200D;
}

size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

uint32_t decode(const std::string& text, size_t index, size_t length) {
    const auto lead = static_cast<unsigned char>(text[index]);
    if (length == 1) {
        return lead;
    }
    uint32_t codepoint = lead & (0xFF >> (length + 1));
    for (size_t i = 1; i < length; ++i) {
        codepoint = (codepoint << 6) | (static_cast<unsigned char>(text[index + i]) & 0x3F);
    }
    return codepoint;
}

}

std::string normalize_text(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    bool pending_space = false;
    for (unsigned char ch : text) {
        const bool keep = std::isalnum(ch) || ch == '\'' || ch == '+' || ch >= 0x80;
        if (!keep) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized.push_back(' ');
            pending_space = false;
        }
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

bool contains_phrase(const std::string& text, const std::string& phrase) {
    const auto needle = normalize_text(phrase);
    if (needle.empty()) {
        return false;
    }
    const auto haystack = " " + normalize_text(text) + " ";
    return haystack.find(" " + needle + " ") != std::string::npos;
}

std::optional<std::string> find_phone_number(const std::string& text) {
    static const std::regex pattern(R"((\+?\d[\d\s().-]{8,}\d))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    std::string digits;
    for (char ch : match.str(1)) {
        if (std::isdigit(static_cast<unsigned char>(ch)) || (ch == '+' && digits.empty())) {
            digits.push_back(ch);
        }
    }
    if (digits.size() < 10) {
        return std::nullopt;
    }
    if (digits.front() != '+') {
        digits.insert(digits.begin(), '+');
    }
    return digits;
}

std::string sanitize_for_speech(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        const auto lead = static_cast<unsigned char>(text[i]);
        auto length = utf8_length(lead);
        if (i + length > text.size()) {
            length = 1;
        }
        if (length == 1) {
            if (lead != '*' && lead != '#' && lead != '`' && lead != '_') {
                result.push_back(text[i]);
            }
        } else if (!is_pictograph(decode(text, i, length))) {
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += separator;
        }
        result += item;
    }
    return result;
}

}
