#include "pty/SerialSource.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace VT100Lex {
namespace Pty {

namespace {

// How often the reader wakes up to check for Stop()
constexpr int kPollIntervalMs = 100;

bool ToSpeed(int baudRate, speed_t& speed) {
    switch (baudRate) {
        case 1200: speed = B1200; return true;
        case 2400: speed = B2400; return true;
        case 4800: speed = B4800; return true;
        case 9600: speed = B9600; return true;
        case 19200: speed = B19200; return true;
        case 38400: speed = B38400; return true;
        case 57600: speed = B57600; return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        case 460800: speed = B460800; return true;
        case 921600: speed = B921600; return true;
        default: return false;
    }
}

} // namespace

SerialSource::SerialSource()
    : SerialSource(9600, true)
{
}

SerialSource::SerialSource(int baudRate, bool rawMode)
    : m_fd(-1)
    , m_ownsFd(false)
    , m_baudRate(baudRate)
    , m_rawMode(rawMode)
    , m_termiosSaved(false)
    , m_savedTermios{}
    , m_running(false)
{
}

SerialSource::~SerialSource() {
    Stop();
}

bool SerialSource::Start(const std::string& device) {
    if (m_running || m_readThread.joinable()) {
        spdlog::warn("Byte source already running");
        return false;
    }

    int fd = -1;
    if (device == "-") {
        fd = STDIN_FILENO;
        m_ownsFd = false;
    } else {
        fd = open(device.c_str(), O_RDONLY | O_NOCTTY | O_CLOEXEC);
        if (fd < 0) {
            spdlog::error("Failed to open {}: {}", device, std::strerror(errno));
            return false;
        }
        m_ownsFd = true;
    }

    m_fd = fd;
    m_device = device;

    if (isatty(m_fd) && !ConfigureTerminal()) {
        CloseDevice();
        return false;
    }

    spdlog::info("Byte source started: {}", device);

    m_running = true;
    m_readThread = std::thread(&SerialSource::ReadThread, this);
    return true;
}

bool SerialSource::Attach(int fd) {
    if (m_running || m_readThread.joinable()) {
        spdlog::warn("Byte source already running");
        return false;
    }
    if (fd < 0) {
        spdlog::error("Invalid file descriptor {}", fd);
        return false;
    }

    m_fd = fd;
    m_ownsFd = true;
    m_device = "fd:" + std::to_string(fd);

    m_running = true;
    m_readThread = std::thread(&SerialSource::ReadThread, this);
    return true;
}

void SerialSource::Stop() {
    bool wasRunning = m_running.exchange(false);

    // The reader may already have stopped on EOF; it still needs joining
    if (m_readThread.joinable()) {
        m_readThread.join();
    }

    if (m_fd >= 0) {
        if (wasRunning) {
            spdlog::info("Stopping byte source {}", m_device);
        }
        CloseDevice();
    }
}

void SerialSource::SetDataCallback(DataCallback callback) {
    m_dataCallback = std::move(callback);
}

void SerialSource::SetClosedCallback(ClosedCallback callback) {
    m_closedCallback = std::move(callback);
}

bool SerialSource::ConfigureTerminal() {
    if (tcgetattr(m_fd, &m_savedTermios) != 0) {
        spdlog::error("tcgetattr failed on {}: {}", m_device, std::strerror(errno));
        return false;
    }
    m_termiosSaved = true;

    struct termios tio = m_savedTermios;
    if (m_rawMode) {
        cfmakeraw(&tio);
        tio.c_cflag |= CLOCAL | CREAD;
        tio.c_cc[VMIN] = 1;
        tio.c_cc[VTIME] = 0;
    }

    speed_t speed;
    if (!ToSpeed(m_baudRate, speed)) {
        spdlog::error("Unsupported baud rate {}", m_baudRate);
        return false;
    }
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(m_fd, TCSANOW, &tio) != 0) {
        spdlog::error("tcsetattr failed on {}: {}", m_device, std::strerror(errno));
        return false;
    }

    spdlog::debug("{} configured: {} baud, raw={}", m_device, m_baudRate, m_rawMode);
    return true;
}

void SerialSource::RestoreTerminal() {
    if (!m_termiosSaved) {
        return;
    }
    if (tcsetattr(m_fd, TCSANOW, &m_savedTermios) != 0) {
        spdlog::warn("Failed to restore terminal settings on {}: {}", m_device, std::strerror(errno));
    }
    m_termiosSaved = false;
}

void SerialSource::CloseDevice() {
    RestoreTerminal();
    if (m_ownsFd && m_fd >= 0) {
        close(m_fd);
    }
    m_fd = -1;
    m_ownsFd = false;
}

void SerialSource::ReadThread() {
    spdlog::debug("Read thread started");

    const size_t bufferSize = 4096;
    std::vector<char> buffer(bufferSize);

    while (m_running) {
        struct pollfd pfd = {m_fd, POLLIN, 0};
        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed on {}: {}", m_device, std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t bytesRead = read(m_fd, buffer.data(), bufferSize);
        if (bytesRead < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("read failed on {}: {}", m_device, std::strerror(errno));
            break;
        }
        if (bytesRead == 0) {
            spdlog::info("End of input on {}", m_device);
            break;
        }

        if (m_dataCallback) {
            m_dataCallback(buffer.data(), static_cast<size_t>(bytesRead));
        }
    }

    // Only report a close the caller did not ask for
    if (m_running.exchange(false) && m_closedCallback) {
        m_closedCallback();
    }

    spdlog::debug("Read thread stopped");
}

} // namespace Pty
} // namespace VT100Lex
