#pragma once
#include "client_config.hpp"
#include "homeduino_client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Background loop started by HomeduinoClient::connect(). Each iteration:
// reconnect when the link dropped, poll registered digital / analog / DHT
// inputs (callbacks only on change), ping the device when it has been
// quiet for longer than the ping interval, then sleep.
class LivenessSupervisor
{
public:
    using Clock = std::chrono::steady_clock;

    LivenessSupervisor(HomeduinoClient &client, InputRegistries &inputs, const ClientSettings &settings);
    ~LivenessSupervisor();

    void start();
    // Requests cancellation and waits for the loop to exit. Returns false
    // (and logs) when it did not exit within the cancel timeout; the join
    // that follows still waits for a callback that never returns, requests
    // themselves are bounded by the busy and response timeouts. Called from
    // the loop thread (an input callback) it only requests cancellation and
    // returns false, the owner joins later from another thread.
    bool stop();
    void requestStop();
    bool running() const;
    bool onLoopThread() const;

    int consecutiveFailures() const { return failures_; }
    size_t iterations() const { return iterations_; }

    // One loop body. Returns true when any input was polled.
    bool runOnce();

private:
    HomeduinoClient &client_;
    InputRegistries &inputs_;
    std::chrono::milliseconds pingInterval_;
    std::chrono::milliseconds dhtReadInterval_;
    std::chrono::milliseconds pollSleep_;
    std::chrono::milliseconds idleSleep_;
    std::chrono::milliseconds cancelTimeout_;
    int allowedFailures_;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopRequested_;
    bool exited_;

    std::atomic<int> failures_;
    std::atomic<size_t> iterations_;

    // Last value seen per input, only touched by the loop thread
    std::map<int, int> digitalValues_;
    std::map<int, int> analogValues_;
    std::map<DhtSensor, DhtReading> dhtValues_;
    std::optional<Clock::time_point> lastDhtReadAt_;

    void run();
    void sleepFor(std::chrono::milliseconds duration);
    void recordFailure(const std::string &reason);
    bool pollDigital();
    bool pollAnalog();
    bool pollDht();
    void pingIfIdle();
};
