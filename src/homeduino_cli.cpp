#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include "client_config.hpp"
#include "homeduino_client.hpp"
#include "homeduino_error.hpp"
#include "log.hpp"
#include "raw_pulse_codec.hpp"

static std::atomic<bool> gStopRequested{false};

static void handleSignal(int)
{
    gStopRequested.store(true);
}

static const char *kKeys =
    "{help h usage ? |      | print this message}"
    "{@port          |      | serial device, e.g. /dev/ttyUSB0 (overrides serial_port)}"
    "{@command       |listen| listen, send, ping, raw or protocols}"
    "{@arg1          |      | send: protocol name, raw: command line}"
    "{@arg2          |      | send: values as key=value,key=value}"
    "{config c       |      | configuration file (YAML)}"
    "{receive_pin    |-2    | RF receive pin, -1 disables receiving}"
    "{send_pin       |-2    | RF send pin, -1 disables sending}"
    "{baud b         |0     | baud rate}"
    "{debug d        |      | debug logging}";

// "id=98765,unit=4,state=on" -> map
static RfValues parseValues(const std::string &text)
{
    RfValues values;
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t end = text.find(',', pos);
        if (end == std::string::npos) end = text.size();
        std::string item = text.substr(pos, end - pos);
        size_t eq = item.find('=');
        if (eq != std::string::npos && eq > 0)
            values[item.substr(0, eq)] = item.substr(eq + 1);
        else if (!item.empty())
            logWarn("Ignoring value without '=': " + item);
        pos = end + 1;
    }
    return values;
}

static void rfReceiveCallback(const DecodedProtocol &decoded)
{
    logInfo(decoded.protocol + " " + formatValues(decoded.values));
}

static int runListen(HomeduinoClient &homeduino)
{
    homeduino.addRfReceiveCallback(rfReceiveCallback);
    logInfo("Connecting to Homeduino");
    if (!homeduino.connect())
    {
        logError("Failed to connect to Homeduino");
        return 1;
    }
    while (!gStopRequested.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return 0;
}

static int runSend(HomeduinoClient &homeduino, const std::string &protocol, const std::string &values)
{
    if (protocol.empty())
    {
        logError("send needs a protocol name");
        return 1;
    }
    logInfo("Connecting to Homeduino");
    if (!homeduino.connect(false))
    {
        logError("Failed to connect to Homeduino");
        return 1;
    }
    logDebug("Protocol: " + protocol);
    logDebug("Values: " + values);
    bool ok = homeduino.rfSend(protocol, parseValues(values));
    logInfo(ok ? "RF send acknowledged" : "RF send failed");
    return ok ? 0 : 1;
}

static int runPing(HomeduinoClient &homeduino)
{
    logInfo("Connecting to Homeduino");
    if (!homeduino.connect(false))
    {
        logError("Failed to connect to Homeduino");
        return 1;
    }
    bool ok = homeduino.ping();
    logInfo(ok ? "PING ok" : "PING echo mismatch");
    return ok ? 0 : 1;
}

static int runRaw(HomeduinoClient &homeduino, const std::string &command)
{
    if (command.empty())
    {
        logError("raw needs a command line");
        return 1;
    }
    logInfo("Connecting to Homeduino");
    if (!homeduino.connect(false))
    {
        logError("Failed to connect to Homeduino");
        return 1;
    }
    std::cout << homeduino.send(command) << "\n";
    return 0;
}

static int runProtocols(HomeduinoClient &homeduino)
{
    for (const auto &name : homeduino.rfProtocols())
        std::cout << name << "\n";
    return 0;
}

int main(int argc, char *argv[])
{
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("Homeduino RF gateway client");
    if (parser.has("help"))
    {
        parser.printMessage();
        return 0;
    }

    std::string port = parser.get<std::string>("@port");
    std::string command = parser.get<std::string>("@command");
    std::string arg1 = parser.get<std::string>("@arg1");
    std::string arg2 = parser.get<std::string>("@arg2");
    std::string configPath = parser.has("config") ? parser.get<std::string>("config") : "";
    int receivePin = parser.get<int>("receive_pin");
    int sendPin = parser.get<int>("send_pin");
    int baud = parser.get<int>("baud");
    bool debug = parser.has("debug");
    if (!parser.check())
    {
        parser.printErrors();
        return 1;
    }

    // Load config
    ClientSettings settings;
    if (!configPath.empty())
    {
        if (!loadClientConfig(configPath, settings))
        {
            logError("Cannot read configuration " + configPath);
            return 1;
        }
    }
    else
    {
        std::string used = loadClientConfig({"config/homeduino.yaml", "../config/homeduino.yaml"}, settings);
        if (!used.empty())
            logDebug("Configuration loaded from " + used);
    }

    LogLevel level = LogLevel::Info;
    if (!parseLogLevel(settings.logLevel, level))
        logWarn("Unknown log level " + settings.logLevel);
    setLogLevel(debug ? LogLevel::Debug : level);

    // Command line overrides
    if (!port.empty())
        settings.serialPort = port;
    if (receivePin != -2)
        settings.receivePin = receivePin < 0 ? std::nullopt : std::optional<int>(receivePin);
    if (sendPin != -2)
        settings.sendPin = sendPin < 0 ? std::nullopt : std::optional<int>(sendPin);
    if (baud != 0)
        settings.baudRate = baud;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    auto codec = std::make_shared<RawPulseCodec>(settings.rawPulseLengths);
    HomeduinoClient homeduino(settings, codec);

    int status = 0;
    try
    {
        if (command == "listen")
            status = runListen(homeduino);
        else if (command == "send")
            status = runSend(homeduino, arg1, arg2);
        else if (command == "ping")
            status = runPing(homeduino);
        else if (command == "raw")
            status = runRaw(homeduino, arg1);
        else if (command == "protocols")
            status = runProtocols(homeduino);
        else
        {
            logError("Unknown command " + command);
            parser.printMessage();
            status = 1;
        }
    }
    catch (const HomeduinoError &e)
    {
        logError(std::string("Homeduino error: ") + e.what());
        status = 1;
    }
    catch (const std::exception &e)
    {
        logError(e.what());
        status = 1;
    }

    logInfo("Disconnecting from Homeduino");
    try
    {
        homeduino.disconnect();
    }
    catch (const HomeduinoError &e)
    {
        logError(std::string("Disconnect failed: ") + e.what());
        status = 1;
    }
    return status;
}
