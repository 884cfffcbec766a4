#pragma once
#include "transport.hpp"
#include <atomic>
#include <string>

// POSIX serial transport for the gateway (USB CDC or FTDI adapter).
// Open with a device path like /dev/ttyUSB0 or /dev/ttyACM0.
class SerialTransport : public Transport
{
public:
    SerialTransport();
    ~SerialTransport() override;

    bool open(const std::string &devicePath, const SerialSettings &settings) override;
    void close() override;
    bool isOpen() const override;
    bool sendLine(const std::string &line) override;
    int readSome(char *buffer, size_t length, int timeoutMs) override;

private:
    std::atomic<int> fd;
    bool configurePort(const SerialSettings &settings);
};
