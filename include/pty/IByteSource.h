#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace VT100Lex::Pty {

/**
 * @brief Abstract interface for raw byte sources feeding a lexer
 *
 * This interface abstracts the device operations needed by the driver,
 * enabling testing with pipes or mock implementations instead of a real
 * serial line.
 */
class IByteSource {
public:
    using DataCallback = std::function<void(const char* data, size_t size)>;
    using ClosedCallback = std::function<void()>;

    virtual ~IByteSource() = default;

    // Lifecycle
    virtual bool Start(const std::string& device) = 0;
    virtual void Stop() = 0;
    virtual bool IsRunning() const = 0;

    // Called from the reader thread
    virtual void SetDataCallback(DataCallback callback) = 0;
    virtual void SetClosedCallback(ClosedCallback callback) = 0;
};

} // namespace VT100Lex::Pty
