#include "homeduino_client.hpp"
#include "homeduino_error.hpp"
#include "liveness_supervisor.hpp"
#include "log.hpp"
#include "serial_transport.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

static constexpr int kReaderPollMs = 50;

const char *toString(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting: return "Connecting";
    case ConnectionState::AwaitingReady: return "AwaitingReady";
    case ConnectionState::Ready: return "Ready";
    case ConnectionState::Disconnecting: return "Disconnecting";
    default: return "Unknown";
    }
}

std::shared_ptr<Transport> makeSerialTransport()
{
    return std::make_shared<SerialTransport>();
}

HomeduinoClient::HomeduinoClient(const ClientSettings &settings, std::shared_ptr<const RfCodec> codec,
                                 TransportFactory transportFactory)
    : settings_(settings),
      codec_(std::move(codec)),
      transportFactory_(std::move(transportFactory)),
      rfCallbacks_("RF receive"),
      events_("RF receive events"),
      correlator_(std::chrono::milliseconds(settings.responseTimeoutMs),
                  std::chrono::milliseconds(settings.busyTimeoutMs)),
      pacer_(correlator_, std::chrono::milliseconds(settings.rfSendIntervalMs),
             std::chrono::milliseconds(settings.rfSendPollMs)),
      router_(correlator_, codec_, rfCallbacks_,
              [this](std::function<void()> task) { return events_.post(std::move(task)); }),
      state_(ConnectionState::Disconnected),
      stopReader_(false),
      linkLost_(false),
      lastMessageAt_(Clock::now().time_since_epoch().count())
{
    events_.start();
}

HomeduinoClient::~HomeduinoClient()
{
    try
    {
        disconnect();
    }
    catch (const std::exception &e)
    {
        logError(std::string("Error while disconnecting Homeduino: ") + e.what());
    }
    events_.stop();
    reapSupervisors();
}

// ==================== Connection lifecycle ====================

void HomeduinoClient::setState(ConnectionState state)
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = state;
}

ConnectionState HomeduinoClient::state() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (linkLost_ && state_ != ConnectionState::Disconnected)
        return ConnectionState::Disconnected;
    return state_;
}

bool HomeduinoClient::hasTransport() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return transport_ != nullptr;
}

bool HomeduinoClient::isConnected() const
{
    return hasTransport() && !linkLost_;
}

bool HomeduinoClient::isReady() const
{
    return isConnected() && correlator_.isReady();
}

HomeduinoClient::Clock::time_point HomeduinoClient::lastMessageReceivedAt() const
{
    return Clock::time_point(Clock::duration(lastMessageAt_.load()));
}

bool HomeduinoClient::awaitingResponse() const
{
    return correlator_.awaitingResponse();
}

bool HomeduinoClient::connect(bool startSupervisor)
{
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (isConnected())
        {
            logWarn("Already connected to " + settings_.serialPort);
            return false;
        }
        // Link dropped underneath us, clean up before reopening
        if (hasTransport())
            closeConnection();
        if (!openConnection())
            return false;
    }
    if (startSupervisor && settings_.pingIntervalMs > 0)
        this->startSupervisor();
    return true;
}

void HomeduinoClient::disconnect()
{
    stopSupervisor();

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!hasTransport())
        return;
    logDebug("Disconnecting Homeduino");
    closeConnection();
    if (!correlator_.waitForReady(false, std::chrono::milliseconds(settings_.readyTimeoutMs)))
        throw ResponseTimeoutError("Homeduino still ready after disconnect");
}

bool HomeduinoClient::reconnect()
{
    try
    {
        disconnect();
    }
    catch (const std::exception &e)
    {
        logWarn(std::string("Error during disconnect before reconnect: ") + e.what());
    }
    return connect();
}

bool HomeduinoClient::reconnectLink()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    closeConnection();
    return openConnection();
}

bool HomeduinoClient::openConnection()
{
    setState(ConnectionState::Connecting);
    std::shared_ptr<Transport> transport;
    try
    {
        transport = transportFactory_();
        if (!transport || !transport->open(settings_.serialPort, settings_.serialSettings()))
        {
            logError("Failed to open " + settings_.serialPort);
            setState(ConnectionState::Disconnected);
            return false;
        }
    }
    catch (const std::exception &e)
    {
        logError("Failed to open " + settings_.serialPort + ": " + e.what());
        setState(ConnectionState::Disconnected);
        return false;
    }

    framer_.reset();
    stopReader_ = false;
    linkLost_ = false;
    lastMessageAt_ = Clock::now().time_since_epoch().count();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transport_ = transport;
    }
    correlator_.setReady(false);
    correlator_.attach(transport);
    readerThread_ = std::thread(&HomeduinoClient::readerLoop, this, transport);
    setState(ConnectionState::AwaitingReady);

    if (!correlator_.waitForReady(true, std::chrono::milliseconds(settings_.readyTimeoutMs)))
    {
        logWarn("No ready signal from Homeduino, probing with ping");
        bool echoed = false;
        try
        {
            std::string message = hdcmd::buildPing(pingToken());
            echoed = correlator_.send(message, true) == message;
        }
        catch (const HomeduinoError &e)
        {
            logWarn(std::string("Ping probe failed: ") + e.what());
        }
        if (!echoed)
        {
            closeConnection();
            throw ResponseTimeoutError("Homeduino did not become ready on " + settings_.serialPort);
        }
        correlator_.setReady(true);
    }
    setState(ConnectionState::Ready);

    if (!configureReceiveInterrupt())
    {
        closeConnection();
        return false;
    }
    applyPinModes();
    logInfo("Connected to Homeduino on " + settings_.serialPort);
    return true;
}

void HomeduinoClient::closeConnection()
{
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transport = transport_;
    }
    if (!transport)
    {
        setState(ConnectionState::Disconnected);
        return;
    }

    setState(ConnectionState::Disconnecting);
    stopReader_ = true;
    if (readerThread_.joinable())
        readerThread_.join();
    // Wakes a pending send() with DisconnectedError and clears ready
    correlator_.detach();
    transport->close();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transport_.reset();
    }
    framer_.reset();
    setState(ConnectionState::Disconnected);
    logInfo("port closed");
}

void HomeduinoClient::readerLoop(std::shared_ptr<Transport> transport)
{
    char buffer[256];
    while (!stopReader_)
    {
        int n = transport->readSome(buffer, sizeof(buffer), kReaderPollMs);
        if (n < 0)
        {
            if (!stopReader_)
            {
                logError("Homeduino disconnected, serial port failed");
                linkLost_ = true;
                correlator_.detach();
            }
            break;
        }
        if (n == 0)
            continue;

        for (const auto &line : framer_.feed(buffer, static_cast<size_t>(n)))
        {
            lastMessageAt_ = Clock::now().time_since_epoch().count();
            try
            {
                router_.route(line);
            }
            catch (const std::exception &e)
            {
                logError("Failed to handle line '" + line + "': " + e.what());
            }
        }
    }
}

bool HomeduinoClient::configureReceiveInterrupt()
{
    auto interrupt = settings_.receiveInterrupt();
    if (!interrupt)
        return true;
    try
    {
        std::string response = correlator_.send(hdcmd::buildRfReceive(*interrupt));
        if (response == "ACK")
            return true;
        logError("Failed to configure RF receive interrupt " + std::to_string(*interrupt) + ": " + response);
    }
    catch (const HomeduinoError &e)
    {
        logError(std::string("Failed to configure RF receive interrupt: ") + e.what());
    }
    return false;
}

void HomeduinoClient::applyPinModes()
{
    std::map<int, PinMode> modes;
    {
        std::lock_guard<std::mutex> lock(pinMutex_);
        modes = pinModes_;
    }
    for (const auto &kv : modes)
    {
        try
        {
            if (!pinMode(kv.first, kv.second))
                logWarn("Homeduino refused pin mode for pin " + std::to_string(kv.first));
        }
        catch (const HomeduinoError &e)
        {
            logWarn("Failed to restore pin mode for pin " + std::to_string(kv.first) + ": " + e.what());
        }
    }
}

// ==================== Supervisor ====================

void HomeduinoClient::startSupervisor()
{
    reapSupervisors();
    std::lock_guard<std::mutex> lock(supervisorMutex_);
    if (supervisor_)
        return;
    supervisor_ = std::make_unique<LivenessSupervisor>(*this, inputs_, settings_);
    supervisor_->start();
}

void HomeduinoClient::stopSupervisor()
{
    std::unique_ptr<LivenessSupervisor> supervisor;
    {
        std::lock_guard<std::mutex> lock(supervisorMutex_);
        supervisor = std::move(supervisor_);
    }
    if (supervisor && supervisor->onLoopThread())
    {
        // Called from an input callback: the loop is still on this stack
        logDebug("Stopping liveness supervisor from its own thread");
        supervisor->requestStop();
        std::lock_guard<std::mutex> lock(supervisorMutex_);
        retiredSupervisors_.push_back(std::move(supervisor));
        return;
    }
    if (supervisor)
        supervisor->stop();
    reapSupervisors();
}

void HomeduinoClient::reapSupervisors()
{
    std::vector<std::unique_ptr<LivenessSupervisor>> done;
    {
        std::lock_guard<std::mutex> lock(supervisorMutex_);
        for (auto it = retiredSupervisors_.begin(); it != retiredSupervisors_.end();)
        {
            if ((*it)->onLoopThread())
            {
                ++it;
                continue;
            }
            done.push_back(std::move(*it));
            it = retiredSupervisors_.erase(it);
        }
    }
    for (auto &supervisor : done)
        supervisor->stop();
}

bool HomeduinoClient::supervisorRunning() const
{
    std::lock_guard<std::mutex> lock(supervisorMutex_);
    return supervisor_ && supervisor_->running();
}

int HomeduinoClient::consecutivePingFailures() const
{
    std::lock_guard<std::mutex> lock(supervisorMutex_);
    return supervisor_ ? supervisor_->consecutiveFailures() : 0;
}

// ==================== Commands ====================

std::string HomeduinoClient::send(const std::string &command)
{
    return pacer_.send(command, hdcmd::isRfSend(command));
}

std::string HomeduinoClient::pingToken() const
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    double seconds = std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", seconds);
    return buf;
}

bool HomeduinoClient::ping()
{
    logDebug("Pinging Homeduino");
    std::string message = hdcmd::buildPing(pingToken());
    return correlator_.send(message) == message;
}

bool HomeduinoClient::rfSend(const std::string &protocol, const RfValues &values)
{
    if (!settings_.sendPin)
    {
        logError("No RF send pin configured");
        return false;
    }
    if (!codec_)
    {
        logError("No RF codec configured");
        return false;
    }

    std::vector<int> lengths = codec_->pulseLengths(protocol);
    if (lengths.size() > hdcmd::kPulseLengthSlots)
        throw std::invalid_argument("Protocol " + protocol + " uses more than 8 pulse lengths");
    std::string sequence = codec_->encode(protocol, values);

    std::string command = hdcmd::buildRfSend(*settings_.sendPin, settings_.rfSendRepeats, lengths, sequence);
    std::string response = pacer_.send(command, true);
    if (response != "ACK")
    {
        logWarn("RF send of " + protocol + " failed: " + response);
        return false;
    }
    return true;
}

std::vector<std::string> HomeduinoClient::rfProtocols() const
{
    if (!codec_)
        return {};
    std::vector<std::string> protocols = codec_->listProtocols();
    std::sort(protocols.begin(), protocols.end(), naturalLess);
    return protocols;
}

bool HomeduinoClient::pinMode(int pin, PinMode mode)
{
    return hdcmd::isAck(correlator_.send(hdcmd::buildPinMode(pin, mode)));
}

bool HomeduinoClient::digitalWrite(int pin, bool value)
{
    {
        std::lock_guard<std::mutex> lock(pinMutex_);
        busyPins_.insert(pin);
    }
    struct BusyGuard
    {
        HomeduinoClient &client;
        int pin;
        ~BusyGuard()
        {
            std::lock_guard<std::mutex> lock(client.pinMutex_);
            client.busyPins_.erase(pin);
        }
    } guard{*this, pin};

    return hdcmd::isAck(correlator_.send(hdcmd::buildDigitalWrite(pin, value)));
}

bool HomeduinoClient::isPinBusy(int pin) const
{
    std::lock_guard<std::mutex> lock(pinMutex_);
    return busyPins_.count(pin) > 0;
}

std::optional<int> HomeduinoClient::digitalRead(int pin)
{
    std::string response = correlator_.send(hdcmd::buildDigitalRead(pin));
    int value = 0;
    if (!hdcmd::parseAckInt(response, value))
    {
        logWarn("Digital read of pin " + std::to_string(pin) + " failed: " + response);
        return std::nullopt;
    }
    return value;
}

std::optional<int> HomeduinoClient::analogRead(int pin)
{
    std::string response = correlator_.send(hdcmd::buildAnalogRead(pin));
    int value = 0;
    if (!hdcmd::parseAckInt(response, value))
    {
        logWarn("Analog read of pin " + std::to_string(pin) + " failed: " + response);
        return std::nullopt;
    }
    return value;
}

std::optional<DhtReading> HomeduinoClient::dhtRead(DhtType type, int pin)
{
    std::string response = correlator_.send(hdcmd::buildDhtRead(type, pin));
    DhtReading reading;
    if (!hdcmd::parseAckDht(response, reading))
    {
        logWarn("DHT read of pin " + std::to_string(pin) + " failed: " + response);
        return std::nullopt;
    }
    return reading;
}

// ==================== Callback registration ====================

void HomeduinoClient::addRfReceiveCallback(RfReceiveCallback callback)
{
    rfCallbacks_.add(kAnyRfProtocol, std::move(callback));
}

void HomeduinoClient::addRfReceiveCallback(const std::string &protocol, RfReceiveCallback callback)
{
    rfCallbacks_.add(protocol, std::move(callback));
}

void HomeduinoClient::addDigitalReadCallback(int pin, DigitalCallback callback, PinMode mode)
{
    if (!callback)
        return;
    if (isReady())
    {
        if (!pinMode(pin, mode))
            logWarn("Homeduino refused pin mode for pin " + std::to_string(pin));
    }
    else
    {
        logDebug("Not connected, pin mode for pin " + std::to_string(pin) + " is applied on connect");
    }
    {
        std::lock_guard<std::mutex> lock(pinMutex_);
        pinModes_[pin] = mode;
    }
    inputs_.digital.add(pin, std::move(callback));
}

void HomeduinoClient::addAnalogReadCallback(int pin, AnalogCallback callback)
{
    inputs_.analog.add(pin, std::move(callback));
}

void HomeduinoClient::addDhtReadCallback(DhtType type, int pin, DhtCallback callback)
{
    if (!callback)
        return;
    if (isReady())
    {
        if (!pinMode(pin, PinMode::InputPullup))
            logWarn("Homeduino refused pin mode for DHT pin " + std::to_string(pin));
    }
    {
        std::lock_guard<std::mutex> lock(pinMutex_);
        pinModes_[pin] = PinMode::InputPullup;
    }
    inputs_.dht.add(DhtSensor{type, pin}, std::move(callback));
}
