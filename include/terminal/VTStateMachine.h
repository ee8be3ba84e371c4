#pragma once

#include "Token.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace VT100Lex::Terminal {

// VT100 escape sequence recognizer.
// Consumes one byte at a time and reports each recognized sequence or bare
// character through the token callback. Not thread-safe: a single thread
// must drive one instance.
class VTStateMachine {
public:
    enum class State {
        Ground,        // Normal text
        Escape,        // ESC received
        CsiEntry,      // ESC [ received, collecting body until a letter
        LeftParen,     // ESC ( - G0 character set designation
        RightParen,    // ESC ) - G1 character set designation
        Pound,         // ESC # - line size / alignment
        EscapeDigit,   // ESC <digit> - device status
    };

    static constexpr int kDefaultMaxParamValue = 999;

    explicit VTStateMachine(int maxParamValue = kDefaultMaxParamValue);
    ~VTStateMachine();

    // Process input data
    void ProcessInput(const char* data, size_t size);
    void ProcessByte(uint8_t byte);

    // Called once per recognized token
    void SetTokenCallback(std::function<void(Token)> callback) {
        m_tokenCallback = std::move(callback);
    }

    State GetState() const { return m_state; }
    int GetMaxParamValue() const { return m_maxParamValue; }

    // Drops any partially recognized sequence
    void Reset();

private:
    void HandleGround(uint8_t ch);
    void HandleEscape(uint8_t ch);
    void HandleCsiEntry(uint8_t ch);
    void HandleLeftParen(uint8_t ch);
    void HandleRightParen(uint8_t ch);
    void HandlePound(uint8_t ch);
    void HandleEscapeDigit(uint8_t ch);

    // Sequence interpreter - matches the body after ESC [ (terminator included)
    void HandleCSI(uint8_t terminator);
    void HandleMode(std::string_view body, uint8_t terminator);   // h / l
    void HandleSGR(std::string_view body);                       // m
    void HandleSetScrollingRegion(std::string_view body);        // r
    void HandleCursorMove(std::string_view body, uint8_t terminator);  // A B C D
    void HandleCursorPosition(std::string_view body, TokenValue home, TokenValue pos);  // H f
    void HandleTabClear(std::string_view body);                  // g
    void HandleEraseInLine(std::string_view body);               // K
    void HandleEraseInDisplay(std::string_view body);            // J
    void HandleDeviceAttributes(std::string_view body);          // c
    void HandleConfidenceTest(std::string_view body);            // y
    void HandleLoadLeds(std::string_view body);                  // q

    // Parses "<n><terminator>" or "<n>;<n><terminator>" into m_params
    bool ParseParams(std::string_view body, size_t count);
    std::optional<int> ParseNumber(std::string_view digits) const;

    void Emit(TokenValue value);
    void ReturnToGround();

    State m_state = State::Ground;
    int m_maxParamValue;

    // Longest body kept while waiting for a CSI terminator. Longer bodies are
    // still consumed up to the terminator but can never match.
    static constexpr size_t kMaxSequenceLength = 64;

    std::vector<uint8_t> m_sequence;   // Bytes since ESC, ESC included
    bool m_sequenceOverflow = false;
    std::vector<int> m_params;

    std::function<void(Token)> m_tokenCallback;
};

} // namespace VT100Lex::Terminal
