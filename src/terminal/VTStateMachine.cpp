#include "terminal/VTStateMachine.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

namespace VT100Lex::Terminal {

namespace {

constexpr uint8_t kEscape = 0x1B;

bool IsAsciiLetter(uint8_t ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}

bool IsAsciiDigit(uint8_t ch) {
    return ch >= '0' && ch <= '9';
}

// Printable and not whitespace: '!' through '~'
bool IsGraphic(uint8_t ch) {
    return ch > 0x20 && ch < 0x7F;
}

} // namespace

VTStateMachine::VTStateMachine(int maxParamValue)
    : m_maxParamValue(maxParamValue)
{
    m_sequence.reserve(kMaxSequenceLength);
}

VTStateMachine::~VTStateMachine() {
}

void VTStateMachine::ProcessInput(const char* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        ProcessByte(static_cast<uint8_t>(data[i]));
    }
}

void VTStateMachine::ProcessByte(uint8_t byte) {
    // 7-bit clean
    uint8_t ch = byte & 0x7F;

    if (m_state != State::Ground) {
        if (m_sequence.size() < kMaxSequenceLength) {
            m_sequence.push_back(ch);
        } else {
            m_sequenceOverflow = true;
        }
    }

    switch (m_state) {
        case State::Ground:
            HandleGround(ch);
            break;
        case State::Escape:
            HandleEscape(ch);
            break;
        case State::CsiEntry:
            HandleCsiEntry(ch);
            break;
        case State::LeftParen:
            HandleLeftParen(ch);
            break;
        case State::RightParen:
            HandleRightParen(ch);
            break;
        case State::Pound:
            HandlePound(ch);
            break;
        case State::EscapeDigit:
            HandleEscapeDigit(ch);
            break;
    }
}

void VTStateMachine::Reset() {
    ReturnToGround();
}

void VTStateMachine::HandleGround(uint8_t ch) {
    if (ch == kEscape) {
        m_sequence.assign(1, ch);
        m_state = State::Escape;
        return;
    }

    if (m_tokenCallback) {
        Token token;
        token.value = FromCharacter(ch);
        token.raw.push_back(ch);
        m_tokenCallback(std::move(token));
    }
}

void VTStateMachine::HandleEscape(uint8_t ch) {
    switch (ch) {
        case '[':
            m_state = State::CsiEntry;
            return;
        case '(':
            m_state = State::LeftParen;
            return;
        case ')':
            m_state = State::RightParen;
            return;
        case '#':
            m_state = State::Pound;
            return;

        case 'D': Emit(TokenValue::Index); break;
        case 'M': Emit(TokenValue::RevIndex); break;
        case 'N': Emit(TokenValue::SetSS2); break;
        case 'O': Emit(TokenValue::SetSS3); break;
        case 'E': Emit(TokenValue::NextLine); break;
        case '7': Emit(TokenValue::SaveCursor); break;
        case '8': Emit(TokenValue::RestoreCursor); break;
        case '=': Emit(TokenValue::AltKeypad); break;
        case '>': Emit(TokenValue::NumKeypad); break;
        case 'H': Emit(TokenValue::TabSet); break;
        case 'c': Emit(TokenValue::Reset); break;

        default:
            if (IsAsciiDigit(ch)) {
                // Device status requests have no '['
                m_state = State::EscapeDigit;
                return;
            }
            spdlog::trace("Discarding unknown escape sequence [{:02x}]", fmt::join(m_sequence, " "));
            break;
    }
    ReturnToGround();
}

void VTStateMachine::HandleCsiEntry(uint8_t ch) {
    if (IsAsciiLetter(ch)) {
        // First letter terminates the sequence
        HandleCSI(ch);
        ReturnToGround();
    } else if (!IsGraphic(ch)) {
        spdlog::trace("Aborting CSI sequence on byte 0x{:02x}", ch);
        ReturnToGround();
    }
    // Digits, ';', '?' and other graphic characters accumulate in m_sequence
}

void VTStateMachine::HandleLeftParen(uint8_t ch) {
    switch (ch) {
        case 'A': Emit(TokenValue::SetUKG0); break;
        case 'B': Emit(TokenValue::SetUSG0); break;
        case '0': Emit(TokenValue::SetSpecG0); break;
        case '1': Emit(TokenValue::SetAltG0); break;
        case '2': Emit(TokenValue::SetAltSpecG0); break;
        default: break;
    }
    ReturnToGround();
}

void VTStateMachine::HandleRightParen(uint8_t ch) {
    switch (ch) {
        case 'A': Emit(TokenValue::SetUKG1); break;
        case 'B': Emit(TokenValue::SetUSG1); break;
        case '0': Emit(TokenValue::SetSpecG1); break;
        case '1': Emit(TokenValue::SetAltG1); break;
        case '2': Emit(TokenValue::SetAltSpecG1); break;
        default: break;
    }
    ReturnToGround();
}

void VTStateMachine::HandlePound(uint8_t ch) {
    switch (ch) {
        case '3': Emit(TokenValue::DhTop); break;
        case '4': Emit(TokenValue::DhBot); break;
        case '5': Emit(TokenValue::Swsh); break;
        case '6': Emit(TokenValue::Dwsh); break;
        case '8': Emit(TokenValue::Align); break;
        default: break;
    }
    ReturnToGround();
}

void VTStateMachine::HandleEscapeDigit(uint8_t ch) {
    // m_sequence is ESC, digit, ch
    if (ch == 'n') {
        if (m_sequence[1] == '5') {
            Emit(TokenValue::DevStat);
        } else if (m_sequence[1] == '6') {
            Emit(TokenValue::GetCursor);
        }
    }
    ReturnToGround();
}

void VTStateMachine::Emit(TokenValue value) {
    if (!m_tokenCallback) {
        return;
    }

    Token token;
    token.value = value;
    token.params = m_params;
    token.raw = m_sequence;
    m_tokenCallback(std::move(token));
}

void VTStateMachine::ReturnToGround() {
    m_state = State::Ground;
    m_sequence.clear();
    m_sequenceOverflow = false;
    m_params.clear();
}

} // namespace VT100Lex::Terminal
