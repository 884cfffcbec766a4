#include "serial_transport.hpp"
#include "log.hpp"
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>
#include <string.h>

SerialTransport::SerialTransport() : fd(-1) {}
SerialTransport::~SerialTransport() { close(); }

static bool baudToFlag(int baud, speed_t &out)
{
    switch (baud)
    {
    case 9600: out = B9600; return true;
    case 19200: out = B19200; return true;
    case 38400: out = B38400; return true;
    case 57600: out = B57600; return true;
    case 115200: out = B115200; return true;
    default: return false;
    }
}

bool SerialTransport::configurePort(const SerialSettings &settings)
{
    speed_t sp;
    if (!baudToFlag(settings.baudRate, sp))
    {
        logError("Unsupported baud rate " + std::to_string(settings.baudRate));
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0)
    {
        logError(std::string("tcgetattr failed: ") + strerror(errno));
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSIZE;
    switch (settings.dataBits)
    {
    case 7: tio.c_cflag |= CS7; break;
    default: tio.c_cflag |= CS8; break;
    }
    switch (settings.parity)
    {
    case Parity::None:
        tio.c_cflag &= ~PARENB;
        break;
    case Parity::Even:
        tio.c_cflag |= PARENB;
        tio.c_cflag &= ~PARODD;
        break;
    case Parity::Odd:
        tio.c_cflag |= (PARENB | PARODD);
        break;
    }
    if (settings.stopBits == 2)
        tio.c_cflag |= CSTOPB;
    else
        tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS; // no HW flow
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cc[VMIN] = 0;   // non-blocking read, readSome() waits in poll()
    tio.c_cc[VTIME] = 0;

    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    if (tcsetattr(fd, TCSANOW, &tio) != 0)
    {
        logError(std::string("tcsetattr failed: ") + strerror(errno));
        return false;
    }

    // Drop whatever the device printed before we were listening
    tcflush(fd, TCIOFLUSH);
    return true;
}

bool SerialTransport::open(const std::string &devicePath, const SerialSettings &settings)
{
    close();

    struct stat st;
    if (::stat(devicePath.c_str(), &st) != 0)
    {
        logWarn("No such file or directory: '" + devicePath + "'");
        return false;
    }

    int handle = ::open(devicePath.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (handle < 0)
    {
        logError("open(" + devicePath + ") failed: " + strerror(errno));
        return false;
    }
    fd = handle;
    if (!configurePort(settings))
    {
        close();
        return false;
    }
    return true;
}

void SerialTransport::close()
{
    int handle = fd.exchange(-1);
    if (handle >= 0)
        ::close(handle);
}

bool SerialTransport::isOpen() const
{
    return fd >= 0;
}

bool SerialTransport::sendLine(const std::string &line)
{
    int handle = fd;
    if (handle < 0) return false;
    std::string data = line;
    if (data.empty() || data.back() != '\n') data.push_back('\n');

    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(handle, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
            {
                struct pollfd pfd{handle, POLLOUT, 0};
                ::poll(&pfd, 1, 100);
                continue;
            }
            logError(std::string("write failed: ") + strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

int SerialTransport::readSome(char *buffer, size_t length, int timeoutMs)
{
    int handle = fd;
    if (handle < 0) return -1;

    struct pollfd pfd{handle, POLLIN, 0};
    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc < 0)
    {
        if (errno == EINTR) return 0;
        logError(std::string("poll failed: ") + strerror(errno));
        return -1;
    }
    if (rc == 0) return 0;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        return -1;

    ssize_t n = ::read(handle, buffer, length);
    if (n < 0)
    {
        if (errno == EAGAIN || errno == EINTR) return 0;
        logError(std::string("read failed: ") + strerror(errno));
        return -1;
    }
    // Readable but no bytes: the device went away (USB unplugged)
    if (n == 0) return -1;
    return static_cast<int>(n);
}
