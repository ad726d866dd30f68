#ifndef FRAME_PARSER_H
#define FRAME_PARSER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
 * KIRIRI notification protocol: ASCII frame terminated by carriage return
 *
 *   N:<y>:<x>\r
 *
 *   N:   start marker (2 bytes)
 *   <y>  signed decimal integer, centidegrees (forward/back)
 *   :    separator
 *   <x>  signed decimal integer, centidegrees (left/right)
 *   \r   end marker
 *
 * Example: N:1234:-567\r -> y = 12.34, x = -5.67
 */

#define FRAME_START_MARKER   "N:"
#define FRAME_START_LEN      2
#define FRAME_SEPARATOR      ':'
#define FRAME_END_MARKER     '\r'

struct FrameValue {
    double y;
    double x;
};

// Decode the first frame in a buffer. Anchors on the first start marker only.
// Returns std::nullopt for any malformed, truncated or out-of-range input.
std::optional<FrameValue> parseFrame(const uint8_t* data, size_t length);

inline std::optional<FrameValue> parseFrame(const std::string& text) {
    return parseFrame(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// -----------------------------------------------------------------------------
// FrameAssembler
// -----------------------------------------------------------------------------
// Joins frames split across notifications. Each push() appends one payload and
// returns every complete frame found, oldest first. Bytes that cannot start a
// frame are discarded; an unterminated tail beginning with the start marker is
// kept until the next push() or until it exceeds the buffer limit.
// Not thread-safe: one producer (the radio callback) per instance.

class FrameAssembler {
public:
    explicit FrameAssembler(size_t bufferLimit);

    std::vector<FrameValue> push(const uint8_t* data, size_t length);

    void reset();

    // Terminated segments that did not decode, tails with no start marker
    // and discarded oversize tails
    uint32_t droppedSegments() const { return dropped; }

    size_t pendingBytes() const { return buffer.size(); }

private:
    std::string buffer;
    size_t limit;
    uint32_t dropped = 0;
};

#endif // FRAME_PARSER_H
