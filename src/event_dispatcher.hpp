#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Single worker thread that runs posted tasks in posting order. Keeps user
// callbacks off the serial reader thread, which must stay free to deliver
// responses to commands those callbacks issue.
class EventDispatcher
{
public:
    using Task = std::function<void()>;

    explicit EventDispatcher(std::string name);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher &) = delete;
    EventDispatcher &operator=(const EventDispatcher &) = delete;

    void start();
    // Drops queued tasks and joins the worker. Called from the worker itself
    // it only requests the stop.
    void stop();

    // False when the dispatcher is not running
    bool post(Task task);

    bool onDispatchThread() const;
    size_t pending() const;

private:
    std::string name_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool running_;
    bool stopRequested_;

    void run();
};
