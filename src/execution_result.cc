#include "trialbox/execution_result.hh"

namespace trialbox {

std::string_view to_string(ExecutionResult::Status status) noexcept {
    using enum ExecutionResult::Status;
    switch (status) {
    case Ok: return "Ok";
    case SafetyViolation: return "SafetyViolation";
    case ExecutionTimeout: return "ExecutionTimeout";
    case CpuLimitExceeded: return "CpuLimitExceeded";
    case MemoryLimitExceeded: return "MemoryLimitExceeded";
    case FileSizeLimitExceeded: return "FileSizeLimitExceeded";
    case ResourceLimitExceeded: return "ResourceLimitExceeded";
    case RuntimeFault: return "RuntimeFault";
    case TestDiscoveryFailure: return "TestDiscoveryFailure";
    case TestFailure: return "TestFailure";
    case InternalFault: return "InternalFault";
    }
    return "Unknown";
}

} // namespace trialbox
