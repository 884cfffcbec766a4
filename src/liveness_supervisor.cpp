#include "liveness_supervisor.hpp"
#include "homeduino_error.hpp"
#include "log.hpp"

LivenessSupervisor::LivenessSupervisor(HomeduinoClient &client, InputRegistries &inputs,
                                       const ClientSettings &settings)
    : client_(client),
      inputs_(inputs),
      pingInterval_(settings.pingIntervalMs),
      dhtReadInterval_(settings.dhtReadIntervalMs),
      pollSleep_(settings.pollSleepMs),
      idleSleep_(settings.idleSleepMs),
      cancelTimeout_(settings.supervisorCancelTimeoutMs),
      allowedFailures_(settings.pingAllowedFailures),
      stopRequested_(false),
      exited_(true),
      failures_(0),
      iterations_(0)
{
}

LivenessSupervisor::~LivenessSupervisor()
{
    stop();
}

void LivenessSupervisor::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable())
        return;
    stopRequested_ = false;
    exited_ = false;
    thread_ = std::thread(&LivenessSupervisor::run, this);
}

void LivenessSupervisor::requestStop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();
}

bool LivenessSupervisor::onLoopThread() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && thread_.get_id() == std::this_thread::get_id();
}

bool LivenessSupervisor::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable())
            return true;
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (onLoopThread())
        return false;

    bool exited;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        exited = cv_.wait_for(lock, cancelTimeout_, [&]{ return exited_; });
    }
    if (!exited)
        logError("Liveness supervisor did not stop within " + std::to_string(cancelTimeout_.count()) + " ms");
    thread_.join();
    return exited;
}

bool LivenessSupervisor::running() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !exited_;
}

void LivenessSupervisor::sleepFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [&]{ return stopRequested_.load(); });
}

void LivenessSupervisor::recordFailure(const std::string &reason)
{
    int failures = ++failures_;
    logWarn("Homeduino liveness check failed (" + std::to_string(failures) + "): " + reason);
    if (failures == allowedFailures_ + 1)
        logError("Homeduino not responding, " + std::to_string(failures) + " consecutive failures");
}

void LivenessSupervisor::run()
{
    logDebug("Liveness supervisor started");
    while (!stopRequested_)
    {
        bool polled = false;
        try
        {
            polled = runOnce();
        }
        catch (const ResponseTimeoutError &e)
        {
            recordFailure(e.what());
        }
        catch (const std::exception &e)
        {
            logError(std::string("Liveness supervisor iteration failed: ") + e.what());
        }
        ++iterations_;
        if (stopRequested_)
            break;
        sleepFor(polled ? pollSleep_ : idleSleep_);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        exited_ = true;
    }
    cv_.notify_all();
    logDebug("Liveness supervisor stopped");
}

bool LivenessSupervisor::runOnce()
{
    if (!client_.isConnected())
    {
        logInfo("Homeduino not connected, reconnecting");
        if (!client_.reconnectLink())
        {
            logWarn("Reconnecting to Homeduino failed");
            return false;
        }
    }

    bool polled = pollDigital();
    if (stopRequested_) return polled;
    polled = pollAnalog() || polled;
    if (stopRequested_) return polled;
    polled = pollDht() || polled;
    if (stopRequested_) return polled;
    pingIfIdle();
    return polled;
}

bool LivenessSupervisor::pollDigital()
{
    bool polled = false;
    for (int pin : inputs_.digital.keys())
    {
        if (stopRequested_) break;
        if (client_.isPinBusy(pin)) continue;
        auto value = client_.digitalRead(pin);
        polled = true;
        if (!value) continue;

        auto it = digitalValues_.find(pin);
        if (it != digitalValues_.end() && it->second == *value) continue;
        digitalValues_[pin] = *value;
        inputs_.digital.dispatch(pin, pin, *value);
    }
    return polled;
}

bool LivenessSupervisor::pollAnalog()
{
    bool polled = false;
    for (int pin : inputs_.analog.keys())
    {
        if (stopRequested_) break;
        if (client_.isPinBusy(pin)) continue;
        auto value = client_.analogRead(pin);
        polled = true;
        if (!value) continue;

        auto it = analogValues_.find(pin);
        if (it != analogValues_.end() && it->second == *value) continue;
        analogValues_[pin] = *value;
        inputs_.analog.dispatch(pin, pin, *value);
    }
    return polled;
}

bool LivenessSupervisor::pollDht()
{
    auto sensors = inputs_.dht.keys();
    if (sensors.empty()) return false;
    auto now = Clock::now();
    if (lastDhtReadAt_ && now - *lastDhtReadAt_ < dhtReadInterval_) return false;
    lastDhtReadAt_ = now;

    for (const auto &sensor : sensors)
    {
        if (stopRequested_) break;
        if (client_.isPinBusy(sensor.pin)) continue;
        auto reading = client_.dhtRead(sensor.type, sensor.pin);
        if (!reading) continue;

        auto it = dhtValues_.find(sensor);
        if (it != dhtValues_.end() && it->second == *reading) continue;
        dhtValues_[sensor] = *reading;
        inputs_.dht.dispatch(sensor, sensor.pin, *reading);
    }
    return true;
}

void LivenessSupervisor::pingIfIdle()
{
    if (Clock::now() - client_.lastMessageReceivedAt() <= pingInterval_)
        return;
    if (client_.ping())
    {
        if (failures_ > 0)
            logInfo("Homeduino responding again");
        failures_ = 0;
    }
    else
    {
        recordFailure("ping echo mismatch");
    }
}
