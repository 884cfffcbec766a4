// Helpers to format the gateway's ASCII commands and parse its replies.
// Commands are sent without a terminator, the transport appends '\n'.
// Replies arrive CRLF-terminated.
// Examples:
// RF receive 0
// RF send 4 3 260 2680 1275 10550 0 0 0 0 0200020202...
// PM 7 2
// DR 7      -> ACK 1
// AR 0      -> ACK 512
// DHT 22 5  -> ACK 21.5 45.0
// PING 1700000000.123 -> PING 1700000000.123
#pragma once
#include <exception>
#include <string>
#include <vector>

enum class PinMode
{
    Input = 0,
    Output = 1,
    InputPullup = 2
};

enum class DhtType
{
    Dht11 = 11,
    Dht21 = 21,
    Dht22 = 22,
    Dht33 = 33,
    Dht44 = 44
};

struct DhtReading
{
    double temperature = 0.0;
    double humidity = 0.0;

    bool operator==(const DhtReading &other) const
    {
        return temperature == other.temperature && humidity == other.humidity;
    }
    bool operator!=(const DhtReading &other) const { return !(*this == other); }
};

namespace hdcmd
{
constexpr size_t kPulseLengthSlots = 8;

inline std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::vector<std::string> split(const std::string &s)
{
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size())
    {
        size_t b = s.find_first_not_of(' ', pos);
        if (b == std::string::npos) break;
        size_t e = s.find(' ', b);
        if (e == std::string::npos) e = s.size();
        parts.push_back(s.substr(b, e - b));
        pos = e;
    }
    return parts;
}

inline bool startsWith(const std::string &s, const std::string &prefix)
{
    return s.rfind(prefix, 0) == 0;
}

inline std::string buildRfReceive(int interrupt)
{
    return "RF receive " + std::to_string(interrupt);
}

// Pulse lengths are padded with 0 up to the eight slots the firmware expects.
inline std::string buildRfSend(int pin, int repeats, const std::vector<int> &pulseLengths,
                               const std::string &pulseSequence)
{
    std::string out = "RF send " + std::to_string(pin) + " " + std::to_string(repeats) + " ";
    for (size_t i = 0; i < kPulseLengthSlots; ++i)
    {
        int v = i < pulseLengths.size() ? pulseLengths[i] : 0;
        out += std::to_string(v) + " ";
    }
    return out + pulseSequence;
}

inline bool isRfSend(const std::string &command)
{
    return startsWith(command, "RF send ");
}

inline std::string buildPinMode(int pin, PinMode mode)
{
    return "PM " + std::to_string(pin) + " " + std::to_string(static_cast<int>(mode));
}

inline std::string buildDigitalWrite(int pin, bool value)
{
    return "DW " + std::to_string(pin) + " " + (value ? "1" : "0");
}

inline std::string buildDigitalRead(int pin)
{
    return "DR " + std::to_string(pin);
}

inline std::string buildAnalogRead(int pin)
{
    return "AR " + std::to_string(pin);
}

inline std::string buildDhtRead(DhtType type, int pin)
{
    return "DHT " + std::to_string(static_cast<int>(type)) + " " + std::to_string(pin);
}

inline std::string buildPing(const std::string &token)
{
    return "PING " + token;
}

inline bool isAck(const std::string &reply)
{
    return reply == "ACK" || startsWith(reply, "ACK ");
}

// "ACK <n>" -> n
inline bool parseAckInt(const std::string &reply, int &out)
{
    auto parts = split(reply);
    if (parts.size() != 2 || parts[0] != "ACK") return false;
    try
    {
        size_t used = 0;
        int v = std::stoi(parts[1], &used);
        if (used != parts[1].size()) return false;
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// "ACK <temperature> <humidity>"
inline bool parseAckDht(const std::string &reply, DhtReading &out)
{
    auto parts = split(reply);
    if (parts.size() != 3 || parts[0] != "ACK") return false;
    try
    {
        size_t usedT = 0, usedH = 0;
        double t = std::stod(parts[1], &usedT);
        double h = std::stod(parts[2], &usedH);
        if (usedT != parts[1].size() || usedH != parts[2].size()) return false;
        out.temperature = t;
        out.humidity = h;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}
} // namespace hdcmd
