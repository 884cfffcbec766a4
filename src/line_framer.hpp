#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Splits the gateway byte stream into trimmed CRLF-delimited lines.
// Raw bytes are buffered across feed() calls, so a line split over several
// reads (or a multi-byte UTF-8 sequence split over reads) is only checked
// once it is complete. The output does not depend on chunk boundaries.
class LineFramer
{
public:
    static constexpr size_t kDefaultMaxLineLength = 1024;

    explicit LineFramer(size_t maxLineLength = kDefaultMaxLineLength);

    std::vector<std::string> feed(const char *data, size_t length);
    std::vector<std::string> feed(const std::string &data) { return feed(data.data(), data.size()); }

    // Drop any buffered partial line, used when a new connection starts.
    void reset();

    size_t buffered() const { return buffer_.size(); }
    size_t droppedLines() const { return dropped_; }

    static bool isValidUtf8(const std::string &bytes);

private:
    size_t maxLineLength_;
    std::string buffer_;
    bool discarding_;
    size_t dropped_;

    void emit(std::string raw, std::vector<std::string> &out);
};
