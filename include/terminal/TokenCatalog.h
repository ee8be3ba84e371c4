#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace VT100Lex::Terminal {

// Discriminator for every recognized outcome.
// Named escape sequences count down from -1 in catalog order; a bare 7-bit
// character is represented by its own byte value (0..127).
enum class TokenValue : int {
    Align = -1,
    AltKeypad = -2,
    Blink = -3,
    Bold = -4,
    ClearBOL = -5,
    ClearBOS = -6,
    ClearEOL = -7,
    ClearEOS = -8,
    ClearLine = -9,
    ClearScreen = -10,
    CursorDn = -11,
    CursorHome = -12,
    CursorLf = -13,
    CursorPos = -14,
    CursorRt = -15,
    CursorUp = -16,
    DevStat = -17,
    DhBot = -18,
    DhTop = -19,
    Dwsh = -20,
    GetCursor = -21,
    HvHome = -22,
    HvPos = -23,
    Ident = -24,
    Index = -25,
    Invisible = -26,
    Led1 = -27,
    Led2 = -28,
    Led3 = -29,
    Led4 = -30,
    LedsOff = -31,
    LowInt = -32,
    ModesOff = -33,
    NextLine = -34,
    NumKeypad = -35,
    Reset = -36,
    ResetCol = -37,
    ResetInter = -38,
    ResetRep = -39,
    ResetWrap = -40,
    RestoreCursor = -41,
    Reverse = -42,
    RevIndex = -43,
    SaveCursor = -44,
    SetAltG0 = -45,
    SetAltG1 = -46,
    SetAltSpecG0 = -47,
    SetAltSpecG1 = -48,
    SetAppl = -49,
    SetCol = -50,
    SetCursor = -51,
    SetInter = -52,
    SetJump = -53,
    SetLF = -54,
    SetNL = -55,
    SetNormScrn = -56,
    SetOrgAbs = -57,
    SetOrgRel = -58,
    SetRep = -59,
    SetRevScrn = -60,
    SetSmooth = -61,
    SetSpecG0 = -62,
    SetSpecG1 = -63,
    SetSS2 = -64,
    SetSS3 = -65,
    SetUKG0 = -66,
    SetUKG1 = -67,
    SetUSG0 = -68,
    SetUSG1 = -69,
    SetVT52 = -70,
    SetWin = -71,
    SetWrap = -72,
    Swsh = -73,
    TabClr = -74,
    TabClrAll = -75,
    TabSet = -76,
    TestLB = -77,
    TestLBRep = -78,
    TestPU = -79,
    TestPURep = -80,
    Underline = -81,
};

// Number of named discriminators declared above
static constexpr size_t kNamedTokenCount = 81;

inline TokenValue FromCharacter(uint8_t ch) {
    return static_cast<TokenValue>(ch & 0x7F);
}

inline bool IsCharacter(TokenValue value) {
    int v = static_cast<int>(value);
    return v >= 0 && v <= 0x7F;
}

// Canonical name of a named discriminator, "?" for anything else
// (raw characters included). Safe to call from any thread.
std::string_view NameOf(TokenValue value);

// Builds the name table if it has not been built yet and verifies that it
// covers exactly kNamedTokenCount entries. Throws std::logic_error on a
// mismatch.
void ValidateCatalog();

} // namespace VT100Lex::Terminal
