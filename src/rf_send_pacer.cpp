#include "rf_send_pacer.hpp"
#include "log.hpp"
#include <algorithm>
#include <thread>

RfSendPacer::RfSendPacer(RequestCorrelator &correlator, std::chrono::milliseconds minInterval,
                         std::chrono::milliseconds pollInterval)
    : correlator_(correlator), minInterval_(minInterval), pollInterval_(pollInterval) {}

std::optional<RfSendPacer::Clock::time_point> RfSendPacer::lastDeparture() const
{
    std::lock_guard<std::mutex> lock(stampMutex_);
    return lastDeparture_;
}

std::string RfSendPacer::send(const std::string &command, bool rfTransmit)
{
    if (!rfTransmit)
        return correlator_.send(command);

    std::lock_guard<std::mutex> rfLock(rfMutex_);
    auto last = lastDeparture();
    if (last)
    {
        bool logged = false;
        while (Clock::now() - *last < minInterval_)
        {
            if (!logged)
            {
                logDebug("Delaying RF send to keep the minimum send interval");
                logged = true;
            }
            auto remaining = minInterval_ - std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - *last);
            std::this_thread::sleep_for(std::min(pollInterval_, remaining));
        }
    }

    // The clock advances on failure too, a failing radio must not be hammered
    try
    {
        std::string response = correlator_.send(command);
        std::lock_guard<std::mutex> lock(stampMutex_);
        lastDeparture_ = Clock::now();
        return response;
    }
    catch (const std::exception &)
    {
        std::lock_guard<std::mutex> lock(stampMutex_);
        lastDeparture_ = Clock::now();
        throw;
    }
}
