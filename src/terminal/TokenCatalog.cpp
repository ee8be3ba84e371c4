#include "terminal/TokenCatalog.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace VT100Lex::Terminal {

namespace {

// Must list every named TokenValue exactly once
constexpr std::pair<TokenValue, std::string_view> kCatalogEntries[] = {
    {TokenValue::Align, "Align"},
    {TokenValue::AltKeypad, "AltKeypad"},
    {TokenValue::Blink, "Blink"},
    {TokenValue::Bold, "Bold"},
    {TokenValue::ClearBOL, "ClearBOL"},
    {TokenValue::ClearBOS, "ClearBOS"},
    {TokenValue::ClearEOL, "ClearEOL"},
    {TokenValue::ClearEOS, "ClearEOS"},
    {TokenValue::ClearLine, "ClearLine"},
    {TokenValue::ClearScreen, "ClearScreen"},
    {TokenValue::CursorDn, "CursorDn"},
    {TokenValue::CursorHome, "CursorHome"},
    {TokenValue::CursorLf, "CursorLf"},
    {TokenValue::CursorPos, "CursorPos"},
    {TokenValue::CursorRt, "CursorRt"},
    {TokenValue::CursorUp, "CursorUp"},
    {TokenValue::DevStat, "DevStat"},
    {TokenValue::DhBot, "DhBot"},
    {TokenValue::DhTop, "DhTop"},
    {TokenValue::Dwsh, "Dwsh"},
    {TokenValue::GetCursor, "GetCursor"},
    {TokenValue::HvHome, "HvHome"},
    {TokenValue::HvPos, "HvPos"},
    {TokenValue::Ident, "Ident"},
    {TokenValue::Index, "Index"},
    {TokenValue::Invisible, "Invisible"},
    {TokenValue::Led1, "Led1"},
    {TokenValue::Led2, "Led2"},
    {TokenValue::Led3, "Led3"},
    {TokenValue::Led4, "Led4"},
    {TokenValue::LedsOff, "LedsOff"},
    {TokenValue::LowInt, "LowInt"},
    {TokenValue::ModesOff, "ModesOff"},
    {TokenValue::NextLine, "NextLine"},
    {TokenValue::NumKeypad, "NumKeypad"},
    {TokenValue::Reset, "Reset"},
    {TokenValue::ResetCol, "ResetCol"},
    {TokenValue::ResetInter, "ResetInter"},
    {TokenValue::ResetRep, "ResetRep"},
    {TokenValue::ResetWrap, "ResetWrap"},
    {TokenValue::RestoreCursor, "RestoreCursor"},
    {TokenValue::Reverse, "Reverse"},
    {TokenValue::RevIndex, "RevIndex"},
    {TokenValue::SaveCursor, "SaveCursor"},
    {TokenValue::SetAltG0, "SetAltG0"},
    {TokenValue::SetAltG1, "SetAltG1"},
    {TokenValue::SetAltSpecG0, "SetAltSpecG0"},
    {TokenValue::SetAltSpecG1, "SetAltSpecG1"},
    {TokenValue::SetAppl, "SetAppl"},
    {TokenValue::SetCol, "SetCol"},
    {TokenValue::SetCursor, "SetCursor"},
    {TokenValue::SetInter, "SetInter"},
    {TokenValue::SetJump, "SetJump"},
    {TokenValue::SetLF, "SetLF"},
    {TokenValue::SetNL, "SetNL"},
    {TokenValue::SetNormScrn, "SetNormScrn"},
    {TokenValue::SetOrgAbs, "SetOrgAbs"},
    {TokenValue::SetOrgRel, "SetOrgRel"},
    {TokenValue::SetRep, "SetRep"},
    {TokenValue::SetRevScrn, "SetRevScrn"},
    {TokenValue::SetSmooth, "SetSmooth"},
    {TokenValue::SetSpecG0, "SetSpecG0"},
    {TokenValue::SetSpecG1, "SetSpecG1"},
    {TokenValue::SetSS2, "SetSS2"},
    {TokenValue::SetSS3, "SetSS3"},
    {TokenValue::SetUKG0, "SetUKG0"},
    {TokenValue::SetUKG1, "SetUKG1"},
    {TokenValue::SetUSG0, "SetUSG0"},
    {TokenValue::SetUSG1, "SetUSG1"},
    {TokenValue::SetVT52, "SetVT52"},
    {TokenValue::SetWin, "SetWin"},
    {TokenValue::SetWrap, "SetWrap"},
    {TokenValue::Swsh, "Swsh"},
    {TokenValue::TabClr, "TabClr"},
    {TokenValue::TabClrAll, "TabClrAll"},
    {TokenValue::TabSet, "TabSet"},
    {TokenValue::TestLB, "TestLB"},
    {TokenValue::TestLBRep, "TestLBRep"},
    {TokenValue::TestPU, "TestPU"},
    {TokenValue::TestPURep, "TestPURep"},
    {TokenValue::Underline, "Underline"},
};

using NameTable = std::unordered_map<TokenValue, std::string_view>;

NameTable BuildNameTable() {
    NameTable table;
    for (const auto& [value, name] : kCatalogEntries) {
        table.emplace(value, name);
    }

    if (table.size() != kNamedTokenCount) {
        spdlog::critical("Token catalog has {} named entries, expected {}",
                         table.size(), kNamedTokenCount);
        throw std::logic_error("Token catalog does not match the declared token values");
    }

    return table;
}

// Built once, on first use; read-only afterwards
const NameTable& GetNameTable() {
    static const NameTable table = BuildNameTable();
    return table;
}

} // namespace

std::string_view NameOf(TokenValue value) {
    const auto& table = GetNameTable();
    auto it = table.find(value);
    if (it == table.end()) {
        return "?";
    }
    return it->second;
}

void ValidateCatalog() {
    GetNameTable();
}

} // namespace VT100Lex::Terminal
