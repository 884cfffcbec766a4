#pragma once
#include "request_correlator.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

// Keeps RF transmit commands at least minInterval apart so repeated sends
// do not flood the radio. Other commands pass straight through.
class RfSendPacer
{
public:
    using Clock = std::chrono::steady_clock;

    RfSendPacer(RequestCorrelator &correlator, std::chrono::milliseconds minInterval,
                std::chrono::milliseconds pollInterval);

    std::string send(const std::string &command, bool rfTransmit);

    std::optional<Clock::time_point> lastDeparture() const;

private:
    RequestCorrelator &correlator_;
    std::chrono::milliseconds minInterval_;
    std::chrono::milliseconds pollInterval_;

    // Held across wait + send so two RF senders cannot both pass the check
    std::mutex rfMutex_;
    mutable std::mutex stampMutex_;
    std::optional<Clock::time_point> lastDeparture_;
};
