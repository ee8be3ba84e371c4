#pragma once

#include "BoundedQueue.h"
#include "Token.h"
#include "VTStateMachine.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace VT100Lex::Terminal {

struct LexerOptions {
    size_t inputQueueCapacity = 10;
    size_t outputQueueCapacity = 10;
    int maxParamValue = VTStateMachine::kDefaultMaxParamValue;
};

// Streaming front end for VTStateMachine.
// Bytes go in through Feed(), a worker thread runs the state machine and
// pushes tokens to the output queue. The worker is the only thread that
// touches the state machine.
class Lexer {
public:
    Lexer();
    explicit Lexer(const LexerOptions& options);
    ~Lexer();

    Lexer(const Lexer&) = delete;
    Lexer& operator=(const Lexer&) = delete;

    // Enqueue input, blocking while the input queue is full.
    // Returns false once the lexer has been shut down.
    bool Feed(uint8_t byte);
    bool Feed(const char* data, size_t size);

    // Blocks until the next token is available. Empty after Shutdown().
    std::optional<Token> NextToken();

    // Direct access for callers that poll or wait with their own deadline
    BoundedQueue<Token>& Output() { return m_output; }

    // Stops the worker and waits for it to exit. Unprocessed input is dropped.
    void Shutdown();

    bool IsRunning() const { return m_running; }

    // Bytes accepted by Feed() whose tokens have not reached the output
    // queue yet. Zero means every fed byte has been fully processed.
    // Always zero after Shutdown().
    size_t PendingInput() const { return m_running ? m_pendingInput.load() : 0; }

private:
    void WorkerThread();

    BoundedQueue<uint8_t> m_input;
    BoundedQueue<Token> m_output;
    VTStateMachine m_stateMachine;

    std::atomic<bool> m_running;
    std::atomic<size_t> m_pendingInput;
    std::mutex m_shutdownMutex;
    std::thread m_workerThread;
};

} // namespace VT100Lex::Terminal
