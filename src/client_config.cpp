#include "client_config.hpp"
#include "log.hpp"
#include <algorithm>
#include <opencv2/core.hpp>

const std::vector<int> &supportedBaudRates()
{
    static const std::vector<int> rates = {9600, 19200, 38400, 57600, 115200};
    return rates;
}

SerialSettings ClientSettings::serialSettings() const
{
    SerialSettings s;
    s.baudRate = baudRate;
    s.parity = parity;
    s.stopBits = stopBits;
    return s;
}

std::optional<int> ClientSettings::receiveInterrupt() const
{
    if (!receivePin) return std::nullopt;
    int interrupt = *receivePin - 2;
    if (interrupt < 0)
    {
        logWarn("Receive pin " + std::to_string(*receivePin) + " has no interrupt");
        return std::nullopt;
    }
    return interrupt;
}

static void cfgInt(const cv::FileNode &root, const std::string &key, int &value)
{
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isInt() && !n.isReal())
    {
        logWarn("Config key " + key + " is not a number, keeping " + std::to_string(value));
        return;
    }
    value = static_cast<int>(n);
}

static void cfgStr(const cv::FileNode &root, const std::string &key, std::string &value)
{
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (n.isString())
        value = static_cast<std::string>(n);
    else if (n.isInt())
        value = std::to_string(static_cast<int>(n));
}

// A pin key may be set to -1 (or "none") to disable it
static void cfgPin(const cv::FileNode &root, const std::string &key, std::optional<int> &value)
{
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (n.isInt())
    {
        int v = static_cast<int>(n);
        if (v < 0) value.reset();
        else value = v;
        return;
    }
    if (n.isString() && static_cast<std::string>(n) == "none")
        value.reset();
}

static void applyConfig(const cv::FileStorage &fs, ClientSettings &settings)
{
    cv::FileNode root = fs.root();
    cfgStr(root, "serial_port", settings.serialPort);

    int baud = settings.baudRate;
    cfgInt(root, "baud_rate", baud);
    const auto &rates = supportedBaudRates();
    if (std::find(rates.begin(), rates.end(), baud) != rates.end())
        settings.baudRate = baud;
    else
        logWarn("Unsupported baud rate " + std::to_string(baud) + ", keeping " + std::to_string(settings.baudRate));

    std::string parity;
    cfgStr(root, "parity", parity);
    if (parity == "none") settings.parity = Parity::None;
    else if (parity == "even") settings.parity = Parity::Even;
    else if (parity == "odd") settings.parity = Parity::Odd;
    else if (!parity.empty()) logWarn("Unknown parity " + parity);
    cfgInt(root, "stop_bits", settings.stopBits);

    cfgPin(root, "receive_pin", settings.receivePin);
    cfgPin(root, "send_pin", settings.sendPin);
    cfgInt(root, "rf_send_repeats", settings.rfSendRepeats);

    cfgInt(root, "response_timeout_ms", settings.responseTimeoutMs);
    cfgInt(root, "busy_timeout_ms", settings.busyTimeoutMs);
    cfgInt(root, "ready_timeout_ms", settings.readyTimeoutMs);
    cfgInt(root, "rf_send_interval_ms", settings.rfSendIntervalMs);
    cfgInt(root, "rf_send_poll_ms", settings.rfSendPollMs);

    cfgInt(root, "ping_interval_ms", settings.pingIntervalMs);
    cfgInt(root, "ping_allowed_failures", settings.pingAllowedFailures);
    cfgInt(root, "dht_read_interval_ms", settings.dhtReadIntervalMs);
    cfgInt(root, "poll_sleep_ms", settings.pollSleepMs);
    cfgInt(root, "idle_sleep_ms", settings.idleSleepMs);
    cfgInt(root, "supervisor_cancel_timeout_ms", settings.supervisorCancelTimeoutMs);

    cv::FileNode lengths = root["raw_pulse_lengths"];
    if (lengths.isSeq())
    {
        settings.rawPulseLengths.clear();
        for (int i = 0; i < static_cast<int>(lengths.size()); ++i)
            settings.rawPulseLengths.push_back(static_cast<int>(lengths[i]));
    }

    cfgStr(root, "log_level", settings.logLevel);
}

bool loadClientConfig(const std::string &path, ClientSettings &settings)
{
    try
    {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened())
            return false;
        applyConfig(fs, settings);
        return true;
    }
    catch (const cv::Exception &e)
    {
        logError("Failed to parse " + path + ": " + e.what());
        return false;
    }
}

bool loadClientConfigFromString(const std::string &document, ClientSettings &settings)
{
    try
    {
        cv::FileStorage fs(document, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened())
            return false;
        applyConfig(fs, settings);
        return true;
    }
    catch (const cv::Exception &e)
    {
        logError(std::string("Failed to parse configuration: ") + e.what());
        return false;
    }
}

std::string loadClientConfig(const std::vector<std::string> &candidatePaths, ClientSettings &settings)
{
    for (const auto &path : candidatePaths)
    {
        if (loadClientConfig(path, settings))
            return path;
    }
    return "";
}
