#pragma once

#include "trialbox/attempt_memory.hh"

#include <string>

namespace trialbox {

// Renders the digest of the attempts in @p memory that guides the next attempt: progress,
// warnings about repeating failures and the last attempts. Empty memory renders as "".
[[nodiscard]] std::string build_reflection(const ShortTermMemory& memory);

} // namespace trialbox
