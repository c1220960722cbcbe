#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace trellico {
namespace process {

/**
 * @brief What to do with terminal output that is not valid UTF-8
 *
 * DROP: a chunk that does not decode is discarded whole. Multi-byte sequences
 *       split across two reads are lost (both halves fail to decode).
 * BUFFER: an incomplete trailing sequence is held back and prepended to the
 *       next chunk; bytes that can never decode become U+FFFD.
 */
enum class Utf8Policy { DROP, BUFFER };

bool parse_utf8_policy(const std::string &value, Utf8Policy &out);
const char *utf8_policy_to_string(Utf8Policy policy);

bool is_valid_utf8(const char *data, size_t len);

// Length (0-3) of a trailing multi-byte sequence that is valid so far but
// incomplete, i.e. could still be completed by the next chunk
size_t incomplete_utf8_tail(const char *data, size_t len);

/**
 * @brief Per-process chunk decoder
 *
 * decode() returns the text to publish for one raw read, or nullopt when
 * nothing should be published for it.
 */
class Utf8ChunkDecoder {
public:
    explicit Utf8ChunkDecoder(Utf8Policy policy) : policy_(policy) {}

    std::optional<std::string> decode(const char *data, size_t len);

    // Bytes held back under BUFFER (always empty under DROP)
    size_t pending() const { return pending_.size(); }

    // Discards held-back bytes, returns how many were dropped
    size_t discard_pending();

private:
    Utf8Policy policy_;
    std::string pending_;
};

}  // namespace process
}  // namespace trellico
