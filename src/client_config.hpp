#pragma once
#include "transport.hpp"
#include <optional>
#include <string>
#include <vector>

constexpr int kDefaultBaudRate = 115200;
constexpr int kDefaultReceivePin = 2;
constexpr int kDefaultSendPin = 4;

const std::vector<int> &supportedBaudRates();

struct ClientSettings
{
    std::string serialPort = "/dev/ttyUSB0";
    int baudRate = kDefaultBaudRate;
    Parity parity = Parity::None;
    int stopBits = 1;

    // Receive interrupt sent to the device is receivePin - 2 (Arduino Uno)
    std::optional<int> receivePin = kDefaultReceivePin;
    std::optional<int> sendPin = kDefaultSendPin;
    int rfSendRepeats = 3;

    int responseTimeoutMs = 2000;
    int busyTimeoutMs = 1000;
    int readyTimeoutMs = 5000;
    int rfSendIntervalMs = 1000;
    int rfSendPollMs = 100;

    // 0 disables the liveness supervisor
    int pingIntervalMs = 10000;
    int pingAllowedFailures = 3;
    int dhtReadIntervalMs = 10000;
    int pollSleepMs = 100;
    int idleSleepMs = 1000;
    int supervisorCancelTimeoutMs = 5000;

    std::vector<int> rawPulseLengths;
    std::string logLevel = "info";

    SerialSettings serialSettings() const;
    std::optional<int> receiveInterrupt() const;
};

// Reads a YAML/JSON/XML settings file through cv::FileStorage. Keys that
// are absent keep the values already in `settings`.
bool loadClientConfig(const std::string &path, ClientSettings &settings);
// Same, from an in-memory document.
bool loadClientConfigFromString(const std::string &document, ClientSettings &settings);
// Tries each path, stops at the first one that opens. Returns the path used
// or an empty string.
std::string loadClientConfig(const std::vector<std::string> &candidatePaths, ClientSettings &settings);
