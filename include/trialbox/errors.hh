#pragma once

#include <stdexcept>

namespace trialbox {

// The scratch area cannot be created or cleaned, so the sandbox cannot be trusted
class ScratchAreaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Serialized attempt memory is malformed
class MemoryFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace trialbox
