#pragma once
#include "callback_registry.hpp"
#include "client_config.hpp"
#include "command_protocol.hpp"
#include "event_dispatcher.hpp"
#include "line_framer.hpp"
#include "line_router.hpp"
#include "request_correlator.hpp"
#include "rf_codec.hpp"
#include "rf_send_pacer.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

enum class ConnectionState
{
    Disconnected,
    Connecting,
    AwaitingReady,
    Ready,
    Disconnecting
};

const char *toString(ConnectionState state);

struct DhtSensor
{
    DhtType type;
    int pin;

    bool operator<(const DhtSensor &other) const
    {
        if (pin != other.pin) return pin < other.pin;
        return static_cast<int>(type) < static_cast<int>(other.type);
    }
};

using DigitalCallback = std::function<void(int pin, int value)>;
using AnalogCallback = std::function<void(int pin, int value)>;
using DhtCallback = std::function<void(int pin, const DhtReading &reading)>;

// Inputs polled by the liveness supervisor, keyed by pin / sensor
struct InputRegistries
{
    CallbackRegistry<int, int, int> digital{"Digital read"};
    CallbackRegistry<int, int, int> analog{"Analog read"};
    CallbackRegistry<DhtSensor, int, const DhtReading &> dht{"DHT read"};
};

using TransportFactory = std::function<std::shared_ptr<Transport>()>;
std::shared_ptr<Transport> makeSerialTransport();

class LivenessSupervisor;

// Client for a Homeduino RF gateway. Owns the connection (transport plus
// its reader thread), the request correlator, the callback registries and
// the liveness supervisor.
//
// Threads: the reader thread only frames and routes lines. RF receive
// callbacks run on the client's event thread, in arrival order; digital,
// analog and DHT callbacks run on the supervisor thread. Both may call any
// client operation, including disconnect() and reconnect(). A disconnect
// from the supervisor thread returns before that loop has exited; the loop
// ends once the callback returns. Destroying the client from inside one of
// its callbacks is not supported.
class HomeduinoClient
{
public:
    using Clock = std::chrono::steady_clock;

    HomeduinoClient(const ClientSettings &settings, std::shared_ptr<const RfCodec> codec,
                    TransportFactory transportFactory = makeSerialTransport);
    ~HomeduinoClient();

    HomeduinoClient(const HomeduinoClient &) = delete;
    HomeduinoClient &operator=(const HomeduinoClient &) = delete;

    // False when already connected or the port cannot be opened. Throws
    // ResponseTimeoutError when the device neither announces ready nor
    // answers the ping probe.
    bool connect(bool startSupervisor = true);
    // Stops the supervisor, closes the port.
    void disconnect();
    bool reconnect();

    bool isConnected() const;
    bool isReady() const;
    ConnectionState state() const;
    Clock::time_point lastMessageReceivedAt() const;
    bool awaitingResponse() const;
    bool supervisorRunning() const;
    int consecutivePingFailures() const;
    const ClientSettings &settings() const { return settings_; }

    std::string send(const std::string &command);
    bool ping();
    bool rfSend(const std::string &protocol, const RfValues &values);
    // Codec protocols, sorted with naturalLess()
    std::vector<std::string> rfProtocols() const;

    bool pinMode(int pin, PinMode mode);
    bool digitalWrite(int pin, bool value);
    std::optional<int> digitalRead(int pin);
    std::optional<int> analogRead(int pin);
    std::optional<DhtReading> dhtRead(DhtType type, int pin);

    void addRfReceiveCallback(RfReceiveCallback callback);
    void addRfReceiveCallback(const std::string &protocol, RfReceiveCallback callback);
    void addDigitalReadCallback(int pin, DigitalCallback callback, PinMode mode = PinMode::Input);
    void addAnalogReadCallback(int pin, AnalogCallback callback);
    void addDhtReadCallback(DhtType type, int pin, DhtCallback callback);

    // A pin with a write in flight is skipped by input polling
    bool isPinBusy(int pin) const;

    // Close and reopen the link, leaving the supervisor alone. Called from
    // the supervisor thread.
    bool reconnectLink();

private:
    ClientSettings settings_;
    std::shared_ptr<const RfCodec> codec_;
    TransportFactory transportFactory_;

    RfCallbackRegistry rfCallbacks_;
    InputRegistries inputs_;
    EventDispatcher events_;
    RequestCorrelator correlator_;
    RfSendPacer pacer_;
    LineFramer framer_;
    LineRouter router_;

    // connect / disconnect / reconnectLink
    std::mutex lifecycleMutex_;

    mutable std::mutex stateMutex_;
    std::shared_ptr<Transport> transport_;
    ConnectionState state_;

    std::thread readerThread_;
    std::atomic<bool> stopReader_;
    std::atomic<bool> linkLost_;
    std::atomic<Clock::rep> lastMessageAt_;

    mutable std::mutex pinMutex_;
    std::map<int, PinMode> pinModes_;
    std::set<int> busyPins_;

    mutable std::mutex supervisorMutex_;
    std::unique_ptr<LivenessSupervisor> supervisor_;
    // Stopped from their own loop thread, joined on the next start / stop
    std::vector<std::unique_ptr<LivenessSupervisor>> retiredSupervisors_;

    bool openConnection();
    void closeConnection();
    void readerLoop(std::shared_ptr<Transport> transport);
    void setState(ConnectionState state);
    bool hasTransport() const;
    std::string pingToken() const;
    bool configureReceiveInterrupt();
    void applyPinModes();
    void startSupervisor();
    void stopSupervisor();
    void reapSupervisors();
};
