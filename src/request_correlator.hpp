#pragma once
#include "transport.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Serialises commands to the gateway and pairs each one with the next
// response line. The wire format carries no request id: the device answers
// strictly in order, so holding the send slot for the whole round trip is
// what lets any non-event line be attributed to "the" pending request.
class RequestCorrelator
{
public:
    using Clock = std::chrono::steady_clock;

    RequestCorrelator(std::chrono::milliseconds responseTimeout, std::chrono::milliseconds busyTimeout);

    // nullptr detaches; a waiting send() then fails with DisconnectedError.
    void attach(std::shared_ptr<Transport> transport);
    void detach() { attach(nullptr); }
    bool attached() const;

    void setReady(bool ready);
    bool isReady() const;
    // Waits until the ready flag equals wanted. False on timeout.
    bool waitForReady(bool wanted, std::chrono::milliseconds timeout);

    // Throws DisconnectedError, NotReadyError (unless ignoreReady),
    // TooBusyError or ResponseTimeoutError. Returns the trimmed response.
    std::string send(const std::string &command, bool ignoreReady = false);

    // Called by the router for every line that is not an event. Returns
    // false when no request is waiting or the pending one already has its
    // response.
    bool offerResponse(const std::string &line);

    bool awaitingResponse() const;
    std::optional<std::string> pendingCommand() const;

private:
    struct PendingRequest
    {
        std::string command;
        Clock::time_point submittedAt;
        std::optional<std::string> response;
    };

    std::chrono::milliseconds responseTimeout_;
    std::chrono::milliseconds busyTimeout_;

    // Send slot, held from write until response or timeout
    std::timed_mutex slot_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<Transport> transport_;
    bool ready_;
    std::optional<PendingRequest> pending_;
};
