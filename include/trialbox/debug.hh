#pragma once

#include "trialbox/logger.hh"

#ifdef TRIALBOX_DEBUG_LOGS
constexpr bool debug_logs_enabled = true;
#else
constexpr bool debug_logs_enabled = false;
#endif

// Logger that compiles to nothing unless enabled
template <bool enabled, bool verbose_enabled = false>
struct DebugLogger {
    template <class... Args>
    void operator()(Args&&... args) const {
        if constexpr (enabled) {
            stdlog(std::forward<Args>(args)...);
        }
    }

    template <class... Args>
    void verbose(Args&&... args) const {
        if constexpr (enabled and verbose_enabled) {
            stdlog(std::forward<Args>(args)...);
        }
    }
};
