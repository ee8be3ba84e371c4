#pragma once

#include "TokenCatalog.h"
#include <cstdint>
#include <string>
#include <vector>

namespace VT100Lex::Terminal {

// One recognized unit of input: a named escape sequence or a bare character
struct Token {
    TokenValue value{};
    std::vector<int> params;     // Decoded numeric parameters (row/col, counts, region bounds)
    std::vector<uint8_t> raw;    // Exact bytes that produced this token, 7-bit masked

    bool IsCharacter() const { return Terminal::IsCharacter(value); }
    char GetCharacter() const { return static_cast<char>(value); }
};

// Diagnostic rendering, e.g. "CursorPos Params: [13, 17], Byte Seq: [1b 5b 31 33 3b 31 37 48]"
std::string ToString(const Token& token);

} // namespace VT100Lex::Terminal
