#pragma once
#include <stdexcept>
#include <string>

// Errors raised by the request path (send, ping, rfSend, pin operations).
// Transport open failures never surface as exceptions: connect() returns false.
class HomeduinoError : public std::runtime_error
{
public:
    explicit HomeduinoError(const std::string &what) : std::runtime_error(what) {}
};

// No transport attached.
class DisconnectedError : public HomeduinoError
{
public:
    explicit DisconnectedError(const std::string &what) : HomeduinoError(what) {}
};

// Device has not completed its ready handshake.
class NotReadyError : public HomeduinoError
{
public:
    explicit NotReadyError(const std::string &what) : HomeduinoError(what) {}
};

// Send slot still held by another caller after the busy timeout.
class TooBusyError : public HomeduinoError
{
public:
    explicit TooBusyError(const std::string &what) : HomeduinoError(what) {}
};

// No response line within the response window.
class ResponseTimeoutError : public HomeduinoError
{
public:
    explicit ResponseTimeoutError(const std::string &what) : HomeduinoError(what) {}
};
