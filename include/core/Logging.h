#pragma once

#include "core/Config.h"

namespace VT100Lex::Core {

// Installs the default spdlog logger: colored stderr, plus a file sink when
// config.file is set. Returns false (and keeps console logging) if the log
// file cannot be opened.
bool InitLogging(const LoggingConfig& config);

} // namespace VT100Lex::Core
