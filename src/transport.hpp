#pragma once
#include <cstddef>
#include <string>

enum class Parity
{
    None,
    Even,
    Odd
};

struct SerialSettings
{
    int baudRate = 115200;
    int dataBits = 8;
    Parity parity = Parity::None;
    int stopBits = 1;
};

// Byte-stream link to the gateway. One reader thread calls readSome(),
// writes are serialised by the RequestCorrelator.
class Transport
{
public:
    virtual ~Transport() = default;

    virtual bool open(const std::string &devicePath, const SerialSettings &settings) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Appends '\n' if missing.
    virtual bool sendLine(const std::string &line) = 0;

    // Waits up to timeoutMs for input. Returns the number of bytes read,
    // 0 on timeout and -1 once the link is closed or failed.
    virtual int readSome(char *buffer, size_t length, int timeoutMs) = 0;
};
