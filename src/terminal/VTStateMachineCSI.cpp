// VTStateMachineCSI.cpp - ESC [ sequence interpreter
// Part of VTStateMachine implementation

#include "terminal/VTStateMachine.h"
#include <spdlog/spdlog.h>

namespace VT100Lex::Terminal {

namespace {

struct BodyMapping {
    std::string_view body;
    TokenValue value;
};

template <size_t N>
std::optional<TokenValue> FindBody(std::string_view body, const BodyMapping (&table)[N]) {
    for (const auto& entry : table) {
        if (entry.body == body) {
            return entry.value;
        }
    }
    return std::nullopt;
}

constexpr BodyMapping kSetModes[] = {
    {"20h", TokenValue::SetNL},
    {"?1h", TokenValue::SetAppl},
    {"?3h", TokenValue::SetCol},
    {"?4h", TokenValue::SetSmooth},
    {"?5h", TokenValue::SetRevScrn},
    {"?6h", TokenValue::SetOrgRel},
    {"?7h", TokenValue::SetWrap},
    {"?8h", TokenValue::SetRep},
    {"?9h", TokenValue::SetInter},
};

constexpr BodyMapping kResetModes[] = {
    {"20l", TokenValue::SetLF},
    {"?1l", TokenValue::SetCursor},
    {"?2l", TokenValue::SetVT52},
    {"?3l", TokenValue::ResetCol},
    {"?4l", TokenValue::SetJump},
    {"?5l", TokenValue::SetNormScrn},
    {"?6l", TokenValue::SetOrgAbs},
    {"?7l", TokenValue::ResetWrap},
    {"?8l", TokenValue::ResetRep},
    {"?9l", TokenValue::ResetInter},
};

constexpr BodyMapping kCharacterAttributes[] = {
    {"m", TokenValue::ModesOff},
    {"0m", TokenValue::ModesOff},
    {"1m", TokenValue::Bold},
    {"2m", TokenValue::LowInt},
    {"4m", TokenValue::Underline},
    {"5m", TokenValue::Blink},
    {"7m", TokenValue::Reverse},
    {"8m", TokenValue::Invisible},
};

constexpr BodyMapping kTabClears[] = {
    {"g", TokenValue::TabClr},
    {"0g", TokenValue::TabClr},
    {"3g", TokenValue::TabClrAll},
};

constexpr BodyMapping kLineErases[] = {
    {"K", TokenValue::ClearEOL},
    {"0K", TokenValue::ClearEOL},
    {"1K", TokenValue::ClearBOL},
    {"2K", TokenValue::ClearLine},
};

constexpr BodyMapping kDisplayErases[] = {
    {"J", TokenValue::ClearEOS},
    {"0J", TokenValue::ClearEOS},
    {"1J", TokenValue::ClearBOS},
    {"2J", TokenValue::ClearScreen},
};

constexpr BodyMapping kIdentify[] = {
    {"c", TokenValue::Ident},
    {"0c", TokenValue::Ident},
};

constexpr BodyMapping kConfidenceTests[] = {
    {"2;1y", TokenValue::TestPU},
    {"2;2y", TokenValue::TestLB},
    {"2;9y", TokenValue::TestPURep},
    {"2;10y", TokenValue::TestLBRep},
};

constexpr BodyMapping kLeds[] = {
    {"0q", TokenValue::LedsOff},
    {"1q", TokenValue::Led1},
    {"2q", TokenValue::Led2},
    {"3q", TokenValue::Led3},
    {"4q", TokenValue::Led4},
};

// Longest digit run accepted before the value check; keeps int conversion in range
constexpr size_t kMaxParamDigits = 9;

} // namespace

void VTStateMachine::HandleCSI(uint8_t terminator) {
    if (m_sequenceOverflow) {
        spdlog::trace("Discarding oversized CSI sequence ending in '{}'", static_cast<char>(terminator));
        return;
    }

    // Everything after ESC [, terminator included
    std::string_view body(reinterpret_cast<const char*>(m_sequence.data()) + 2,
                          m_sequence.size() - 2);

    switch (terminator) {
        case 'h':
        case 'l':
            HandleMode(body, terminator);
            break;
        case 'm':
            HandleSGR(body);
            break;
        case 'r':
            HandleSetScrollingRegion(body);
            break;
        case 'A':
        case 'B':
        case 'C':
        case 'D':
            HandleCursorMove(body, terminator);
            break;
        case 'H':
            HandleCursorPosition(body, TokenValue::CursorHome, TokenValue::CursorPos);
            break;
        case 'f':
            HandleCursorPosition(body, TokenValue::HvHome, TokenValue::HvPos);
            break;
        case 'g':
            HandleTabClear(body);
            break;
        case 'K':
            HandleEraseInLine(body);
            break;
        case 'J':
            HandleEraseInDisplay(body);
            break;
        case 'c':
            HandleDeviceAttributes(body);
            break;
        case 'y':
            HandleConfidenceTest(body);
            break;
        case 'q':
            HandleLoadLeds(body);
            break;
        default:
            spdlog::trace("Unknown CSI terminator '{}' (body \"{}\")", static_cast<char>(terminator), body);
            break;
    }
}

void VTStateMachine::HandleMode(std::string_view body, uint8_t terminator) {
    auto value = (terminator == 'h') ? FindBody(body, kSetModes) : FindBody(body, kResetModes);
    if (value) {
        Emit(*value);
    }
}

void VTStateMachine::HandleSGR(std::string_view body) {
    if (auto value = FindBody(body, kCharacterAttributes)) {
        Emit(*value);
    }
}

void VTStateMachine::HandleSetScrollingRegion(std::string_view body) {
    // ESC [ top ; bottom r
    if (ParseParams(body, 2)) {
        Emit(TokenValue::SetWin);
    }
}

void VTStateMachine::HandleCursorMove(std::string_view body, uint8_t terminator) {
    if (!ParseParams(body, 1)) {
        return;
    }

    switch (terminator) {
        case 'A': Emit(TokenValue::CursorUp); break;
        case 'B': Emit(TokenValue::CursorDn); break;
        case 'C': Emit(TokenValue::CursorRt); break;
        case 'D': Emit(TokenValue::CursorLf); break;
        default: break;
    }
}

void VTStateMachine::HandleCursorPosition(std::string_view body, TokenValue home, TokenValue pos) {
    // "H" or ";H" home the cursor, "v;hH" positions it
    if (body.size() == 1 || (body.size() == 2 && body[0] == ';')) {
        Emit(home);
    } else if (ParseParams(body, 2)) {
        Emit(pos);
    }
}

void VTStateMachine::HandleTabClear(std::string_view body) {
    if (auto value = FindBody(body, kTabClears)) {
        Emit(*value);
    }
}

void VTStateMachine::HandleEraseInLine(std::string_view body) {
    if (auto value = FindBody(body, kLineErases)) {
        Emit(*value);
    }
}

void VTStateMachine::HandleEraseInDisplay(std::string_view body) {
    if (auto value = FindBody(body, kDisplayErases)) {
        Emit(*value);
    }
}

void VTStateMachine::HandleDeviceAttributes(std::string_view body) {
    if (auto value = FindBody(body, kIdentify)) {
        Emit(*value);
    }
}

void VTStateMachine::HandleConfidenceTest(std::string_view body) {
    if (auto value = FindBody(body, kConfidenceTests)) {
        Emit(*value);
    }
}

void VTStateMachine::HandleLoadLeds(std::string_view body) {
    if (auto value = FindBody(body, kLeds)) {
        Emit(*value);
    }
}

bool VTStateMachine::ParseParams(std::string_view body, size_t count) {
    // Drop the terminator
    std::string_view fields = body.substr(0, body.size() - 1);

    std::vector<int> params;
    bool separatorPending = false;
    while (params.size() < count) {
        size_t sep = fields.find(';');
        std::string_view field = fields.substr(0, sep);

        auto value = ParseNumber(field);
        if (!value) {
            return false;
        }
        params.push_back(*value);

        if (sep == std::string_view::npos) {
            fields = {};
            separatorPending = false;
            break;
        }
        fields.remove_prefix(sep + 1);
        separatorPending = true;
    }

    // A separator after the last field ("5;A") is not part of the grammar
    if (params.size() != count || separatorPending || !fields.empty()) {
        return false;
    }

    m_params = std::move(params);
    return true;
}

std::optional<int> VTStateMachine::ParseNumber(std::string_view digits) const {
    if (digits.empty() || digits.size() > kMaxParamDigits) {
        return std::nullopt;
    }

    int value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }

    if (value > m_maxParamValue) {
        spdlog::trace("Parameter {} exceeds limit {}", value, m_maxParamValue);
        return std::nullopt;
    }
    return value;
}

} // namespace VT100Lex::Terminal
