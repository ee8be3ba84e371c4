#include "terminal/Token.h"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace VT100Lex::Terminal {

std::string ToString(const Token& token) {
    return fmt::format("{} Params: [{}], Byte Seq: [{:02x}]",
                       NameOf(token.value),
                       fmt::join(token.params, ", "),
                       fmt::join(token.raw, " "));
}

} // namespace VT100Lex::Terminal
