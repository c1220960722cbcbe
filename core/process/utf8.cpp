#include "utf8.hpp"

#include <algorithm>
#include <cctype>

namespace trellico {
namespace process {

namespace {

// Expected sequence length for a lead byte, 0 if it cannot start a sequence
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Valid range for the second byte given the lead (overlongs, surrogates, > U+10FFFF)
bool second_byte_ok(unsigned char lead, unsigned char second) {
    switch (lead) {
        case 0xE0:
            return second >= 0xA0 && second <= 0xBF;
        case 0xED:
            return second >= 0x80 && second <= 0x9F;
        case 0xF0:
            return second >= 0x90 && second <= 0xBF;
        case 0xF4:
            return second >= 0x80 && second <= 0x8F;
        default:
            return second >= 0x80 && second <= 0xBF;
    }
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Number of bytes of a valid sequence starting at data[i], or 0 if invalid/truncated
size_t valid_sequence_at(const unsigned char *data, size_t len, size_t i) {
    const size_t need = sequence_length(data[i]);
    if (need == 0 || i + need > len) {
        return 0;
    }
    if (need >= 2 && !second_byte_ok(data[i], data[i + 1])) {
        return 0;
    }
    for (size_t k = 2; k < need; ++k) {
        if (!is_continuation(data[i + k])) {
            return 0;
        }
    }
    return need;
}

// Appends data as text, replacing each undecodable byte with U+FFFD
void append_lossy(std::string &out, const unsigned char *data, size_t len) {
    size_t i = 0;
    while (i < len) {
        size_t n = valid_sequence_at(data, len, i);
        if (n == 0) {
            out += "\xEF\xBF\xBD";
            ++i;
        } else {
            out.append(reinterpret_cast<const char *>(data + i), n);
            i += n;
        }
    }
}

}  // namespace

bool parse_utf8_policy(const std::string &value, Utf8Policy &out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "drop") {
        out = Utf8Policy::DROP;
        return true;
    }
    if (lower == "buffer") {
        out = Utf8Policy::BUFFER;
        return true;
    }
    return false;
}

const char *utf8_policy_to_string(Utf8Policy policy) { return policy == Utf8Policy::BUFFER ? "buffer" : "drop"; }

bool is_valid_utf8(const char *data, size_t len) {
    const auto *bytes = reinterpret_cast<const unsigned char *>(data);
    size_t i = 0;
    while (i < len) {
        size_t n = valid_sequence_at(bytes, len, i);
        if (n == 0) {
            return false;
        }
        i += n;
    }
    return true;
}

size_t incomplete_utf8_tail(const char *data, size_t len) {
    const auto *bytes = reinterpret_cast<const unsigned char *>(data);

    // A tail is at most 3 bytes: a lead byte plus up to 2 continuations
    const size_t max_back = std::min<size_t>(3, len);
    for (size_t back = 1; back <= max_back; ++back) {
        const size_t start = len - back;
        const unsigned char lead = bytes[start];
        if (is_continuation(lead)) {
            continue;
        }

        const size_t need = sequence_length(lead);
        if (need <= back) {
            // Complete (or invalid) sequence, not a pending tail
            return 0;
        }
        if (back >= 2 && !second_byte_ok(lead, bytes[start + 1])) {
            return 0;
        }
        for (size_t k = 2; k < back; ++k) {
            if (!is_continuation(bytes[start + k])) {
                return 0;
            }
        }
        return back;
    }
    return 0;
}

std::optional<std::string> Utf8ChunkDecoder::decode(const char *data, size_t len) {
    if (policy_ == Utf8Policy::DROP) {
        if (len == 0 || !is_valid_utf8(data, len)) {
            return std::nullopt;
        }
        return std::string(data, len);
    }

    pending_.append(data, len);
    const size_t tail = incomplete_utf8_tail(pending_.data(), pending_.size());
    const size_t ready = pending_.size() - tail;
    if (ready == 0) {
        return std::nullopt;
    }

    std::string text;
    if (is_valid_utf8(pending_.data(), ready)) {
        text.assign(pending_, 0, ready);
    } else {
        append_lossy(text, reinterpret_cast<const unsigned char *>(pending_.data()), ready);
    }
    pending_.erase(0, ready);
    return text;
}

size_t Utf8ChunkDecoder::discard_pending() {
    const size_t dropped = pending_.size();
    pending_.clear();
    return dropped;
}

}  // namespace process
}  // namespace trellico
