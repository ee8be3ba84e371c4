#include "terminal/Lexer.h"
#include "terminal/TokenCatalog.h"
#include <spdlog/spdlog.h>

namespace VT100Lex::Terminal {

Lexer::Lexer()
    : Lexer(LexerOptions{})
{
}

Lexer::Lexer(const LexerOptions& options)
    : m_input(options.inputQueueCapacity)
    , m_output(options.outputQueueCapacity)
    , m_stateMachine(options.maxParamValue)
    , m_running(false)
    , m_pendingInput(0)
{
    // Throws before any thread exists if the catalog is inconsistent
    ValidateCatalog();

    m_stateMachine.SetTokenCallback([this](Token token) {
        if (!m_output.Push(std::move(token))) {
            spdlog::trace("Lexer output closed, dropping token");
        }
    });

    m_running = true;
    m_workerThread = std::thread(&Lexer::WorkerThread, this);

    spdlog::debug("Lexer started: input capacity {}, output capacity {}",
                  m_input.Capacity(), m_output.Capacity());
}

Lexer::~Lexer() {
    Shutdown();
}

bool Lexer::Feed(uint8_t byte) {
    if (!m_running) {
        return false;
    }
    ++m_pendingInput;
    if (!m_input.Push(byte)) {
        --m_pendingInput;
        return false;
    }
    return true;
}

bool Lexer::Feed(const char* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        if (!Feed(static_cast<uint8_t>(data[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<Token> Lexer::NextToken() {
    return m_output.Pop();
}

void Lexer::Shutdown() {
    std::lock_guard<std::mutex> lock(m_shutdownMutex);

    if (!m_running.exchange(false)) {
        return;
    }

    spdlog::debug("Stopping lexer");

    // Closing both queues wakes the worker whether it waits for input or
    // for room in the output queue, and releases blocked feeders and readers
    m_input.Close();
    m_output.Close();

    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }

    m_input.Clear();
    m_output.Clear();
}

void Lexer::WorkerThread() {
    spdlog::debug("Lexer worker thread started");

    while (m_running) {
        auto byte = m_input.Pop();
        if (!byte) {
            break;
        }
        m_stateMachine.ProcessByte(*byte);
        --m_pendingInput;
    }

    spdlog::debug("Lexer worker thread stopped");
}

} // namespace VT100Lex::Terminal
