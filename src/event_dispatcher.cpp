#include "event_dispatcher.hpp"
#include "log.hpp"
#include <exception>

EventDispatcher::EventDispatcher(std::string name)
    : name_(std::move(name)), running_(false), stopRequested_(false) {}

EventDispatcher::~EventDispatcher()
{
    stop();
}

void EventDispatcher::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable())
        return;
    stopRequested_ = false;
    running_ = true;
    thread_ = std::thread(&EventDispatcher::run, this);
}

void EventDispatcher::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable())
            return;
        stopRequested_ = true;
        running_ = false;
    }
    cv_.notify_all();
    if (onDispatchThread())
        return;
    thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty())
        logDebug(name_ + ": dropping " + std::to_string(queue_.size()) + " queued events");
    queue_.clear();
}

bool EventDispatcher::post(Task task)
{
    if (!task)
        return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
            return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool EventDispatcher::onDispatchThread() const
{
    return std::this_thread::get_id() == thread_.get_id();
}

size_t EventDispatcher::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventDispatcher::run()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]{ return stopRequested_ || !queue_.empty(); });
            if (stopRequested_)
                break;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            logError(name_ + ": event handler failed: " + e.what());
        }
    }
}
