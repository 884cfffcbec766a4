#include "request_correlator.hpp"
#include "command_protocol.hpp"
#include "homeduino_error.hpp"
#include "log.hpp"

RequestCorrelator::RequestCorrelator(std::chrono::milliseconds responseTimeout,
                                     std::chrono::milliseconds busyTimeout)
    : responseTimeout_(responseTimeout), busyTimeout_(busyTimeout), ready_(false) {}

void RequestCorrelator::attach(std::shared_ptr<Transport> transport)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_ = std::move(transport);
        if (!transport_)
            ready_ = false;
    }
    cv_.notify_all();
}

bool RequestCorrelator::attached() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_ != nullptr;
}

void RequestCorrelator::setReady(bool ready)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = ready;
    }
    cv_.notify_all();
}

bool RequestCorrelator::isReady() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_;
}

bool RequestCorrelator::waitForReady(bool wanted, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{ return ready_ == wanted; });
}

std::string RequestCorrelator::send(const std::string &command, bool ignoreReady)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transport_)
        {
            logError("Not connected, cannot send " + command);
            throw DisconnectedError("Not connected");
        }
        if (!ready_ && !ignoreReady)
        {
            logError("Not ready, cannot send " + command);
            throw NotReadyError("Homeduino is not ready");
        }
    }

    std::unique_lock<std::timed_mutex> slot(slot_, std::try_to_lock);
    if (!slot.owns_lock())
    {
        logInfo("Too busy to transmit " + command + ", waiting");
        if (!slot.try_lock_for(busyTimeout_))
            throw TooBusyError("Too busy to transmit " + command);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    std::shared_ptr<Transport> transport = transport_;
    if (!transport)
        throw DisconnectedError("Disconnected while waiting to send " + command);
    // A reconnect may have happened while this call waited for the slot
    if (!ready_ && !ignoreReady)
    {
        logError("Not ready, cannot send " + command);
        throw NotReadyError("Homeduino is not ready");
    }

    pending_ = PendingRequest{command, Clock::now(), std::nullopt};
    // The pending request must not outlive this call, whatever the exit path
    struct PendingGuard
    {
        std::optional<PendingRequest> &pending;
        ~PendingGuard() { pending.reset(); }
    } guard{pending_};

    // Write without the state lock so the reader thread can deliver the reply
    lock.unlock();
    logDebug("writing data: " + command);
    bool written = transport->sendLine(command);
    lock.lock();
    if (!written)
        throw DisconnectedError("Failed to write " + command);

    bool done = cv_.wait_for(lock, responseTimeout_, [&]{
        return pending_->response.has_value() || transport_ != transport;
    });
    if (pending_->response)
    {
        std::string response = hdcmd::trim(*pending_->response);
        logDebug("response: " + response);
        return response;
    }
    if (done)
        throw DisconnectedError("Disconnected while waiting for response to " + command);

    logWarn("Timeout while waiting for response to " + command);
    throw ResponseTimeoutError("Timeout while waiting for response to " + command);
}

bool RequestCorrelator::offerResponse(const std::string &line)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_ || pending_->response)
            return false;
        pending_->response = line;
    }
    cv_.notify_all();
    return true;
}

bool RequestCorrelator::awaitingResponse() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value() && !pending_->response.has_value();
}

std::optional<std::string> RequestCorrelator::pendingCommand() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) return std::nullopt;
    return pending_->command;
}
