#include "line_framer.hpp"
#include "command_protocol.hpp"
#include "log.hpp"

LineFramer::LineFramer(size_t maxLineLength)
    : maxLineLength_(maxLineLength), discarding_(false), dropped_(0) {}

void LineFramer::reset()
{
    buffer_.clear();
    discarding_ = false;
}

bool LineFramer::isValidUtf8(const std::string &bytes)
{
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n)
    {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        unsigned int cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k)
        {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong encodings, surrogates and out of range code points
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += extra + 1;
    }
    return true;
}

void LineFramer::emit(std::string raw, std::vector<std::string> &out)
{
    if (raw.size() > maxLineLength_)
    {
        ++dropped_;
        logWarn("Dropping overlong line (" + std::to_string(raw.size()) + " bytes)");
        return;
    }
    if (!isValidUtf8(raw))
    {
        ++dropped_;
        std::string shown;
        for (char ch : raw)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            shown += (c >= 0x20 && c < 0x7F) ? ch : '?';
        }
        logWarn("Error during decode of data, invalid data: " + shown);
        return;
    }
    std::string line = hdcmd::trim(raw);
    if (!line.empty())
        out.push_back(line);
}

std::vector<std::string> LineFramer::feed(const char *data, size_t length)
{
    std::vector<std::string> out;
    if (data == nullptr || length == 0) return out;
    buffer_.append(data, length);

    size_t start = 0;
    while (true)
    {
        size_t pos = buffer_.find("\r\n", start);
        if (pos == std::string::npos) break;
        if (discarding_)
        {
            // Tail of an overlong line, already counted and logged
            discarding_ = false;
        }
        else
        {
            emit(buffer_.substr(start, pos - start), out);
        }
        start = pos + 2;
    }
    buffer_.erase(0, start);

    // One byte of slack for the '\r' of a CRLF still in flight
    if (buffer_.size() > maxLineLength_ + 1)
    {
        if (!discarding_)
        {
            ++dropped_;
            logWarn("Dropping overlong line (no CRLF within " + std::to_string(maxLineLength_) + " bytes)");
            discarding_ = true;
        }
        // Keep a trailing '\r' so a CRLF split over two reads is still seen
        if (buffer_.back() == '\r')
            buffer_ = "\r";
        else
            buffer_.clear();
    }
    return out;
}
