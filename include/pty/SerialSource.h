#pragma once

#include "pty/IByteSource.h"
#include <atomic>
#include <string>
#include <termios.h>
#include <thread>

namespace VT100Lex {
namespace Pty {

// Reads raw bytes from a tty, FIFO, regular file or stdin on a background
// thread and hands every chunk to the data callback.
class SerialSource : public IByteSource {
public:
    SerialSource();
    SerialSource(int baudRate, bool rawMode);
    ~SerialSource() override;

    // Open the device ("-" = stdin) and start reading
    bool Start(const std::string& device) override;

    // Start reading from an already open descriptor; takes ownership
    bool Attach(int fd);

    // Stop reading and close the device. Must not be called from a callback.
    void Stop() override;

    bool IsRunning() const override { return m_running; }

    void SetDataCallback(DataCallback callback) override;
    void SetClosedCallback(ClosedCallback callback) override;

    const std::string& GetDevice() const { return m_device; }

private:
    // Thread function for async reads
    void ReadThread();

    bool ConfigureTerminal();
    void RestoreTerminal();
    void CloseDevice();

    int m_fd;
    bool m_ownsFd;
    std::string m_device;

    // tty settings
    int m_baudRate;
    bool m_rawMode;
    bool m_termiosSaved;
    struct termios m_savedTermios;

    std::thread m_readThread;
    std::atomic<bool> m_running;

    DataCallback m_dataCallback;
    ClosedCallback m_closedCallback;
};

} // namespace Pty
} // namespace VT100Lex
