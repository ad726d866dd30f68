#include "frame_parser.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

// Parse a trimmed, optionally signed base-10 integer from [begin, end).
// Anything else (empty, stray characters, overflow) is rejected.
static bool parseCentidegrees(const char* begin, const char* end, long& out) {
    while (begin < end && isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end > begin && isspace(static_cast<unsigned char>(end[-1]))) {
        --end;
    }
    if (begin == end) {
        return false;
    }

    // strtol needs a terminated string
    std::string digits(begin, end);
    char* stop = nullptr;
    errno = 0;
    long value = strtol(digits.c_str(), &stop, 10);

    if (stop != digits.c_str() + digits.size()) {
        return false;
    }
    if (errno == ERANGE || value < INT32_MIN || value > INT32_MAX) {
        return false;
    }
    out = value;
    return true;
}

std::optional<FrameValue> parseFrame(const uint8_t* data, size_t length) {
    if (data == nullptr || length == 0) {
        return std::nullopt;
    }

    const char* begin = reinterpret_cast<const char*>(data);
    const char* end = begin + length;
    const char* marker = FRAME_START_MARKER;

    const char* start = std::search(begin, end, marker, marker + FRAME_START_LEN);
    if (start == end) {
        return std::nullopt;
    }

    const char* yBegin = start + FRAME_START_LEN;
    const char* separator = std::find(yBegin, end, FRAME_SEPARATOR);
    if (separator == end) {
        return std::nullopt;
    }

    const char* xBegin = separator + 1;
    const char* terminator = std::find(xBegin, end, FRAME_END_MARKER);
    if (terminator == end) {
        return std::nullopt;
    }

    long y = 0;
    long x = 0;
    if (!parseCentidegrees(yBegin, separator, y) || !parseCentidegrees(xBegin, terminator, x)) {
        return std::nullopt;
    }

    return FrameValue{y / 100.0, x / 100.0};
}

// -----------------------------------------------------------------------------
// FrameAssembler
// -----------------------------------------------------------------------------

FrameAssembler::FrameAssembler(size_t bufferLimit) : limit(bufferLimit) {}

std::vector<FrameValue> FrameAssembler::push(const uint8_t* data, size_t length) {
    std::vector<FrameValue> frames;
    if (data != nullptr && length > 0) {
        buffer.append(reinterpret_cast<const char*>(data), length);
    }

    size_t endPos;
    while ((endPos = buffer.find(FRAME_END_MARKER)) != std::string::npos) {
        // Anchor on the last start marker before the terminator so a broken
        // frame in front of a good one does not hide it
        size_t startPos = buffer.rfind(FRAME_START_MARKER, endPos);
        if (startPos == std::string::npos) {
            dropped++;
        } else {
            const uint8_t* segment = reinterpret_cast<const uint8_t*>(buffer.data() + startPos);
            std::optional<FrameValue> value = parseFrame(segment, endPos + 1 - startPos);
            if (value) {
                frames.push_back(*value);
            } else {
                dropped++;
            }
        }
        buffer.erase(0, endPos + 1);
    }

    // Keep only what can still become a frame
    size_t startPos = buffer.find(FRAME_START_MARKER);
    if (startPos != std::string::npos) {
        buffer.erase(0, startPos);
    } else if (!buffer.empty() && buffer.back() == FRAME_START_MARKER[0]) {
        buffer.assign(1, FRAME_START_MARKER[0]);
    } else if (!buffer.empty()) {
        // Bytes that can never become a frame
        buffer.clear();
        dropped++;
    }

    if (buffer.size() > limit) {
        buffer.clear();
        dropped++;
    }

    return frames;
}

void FrameAssembler::reset() {
    buffer.clear();
}
