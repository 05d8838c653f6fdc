#pragma once

#include <string>
#include <functional>

namespace querylens::core {

// Result of a crash-guarded operation
struct CrashGuardResult {
    bool crashed = false;
    unsigned int crash_code = 0;
    std::string description;
};

// Run func, converting a driver crash (access violation, SIGSEGV, SIGBUS,
// SIGFPE) into a CrashGuardResult. C++ exceptions propagate unchanged.
// `context` names the operation in the description ("describing get_user").
CrashGuardResult execute_with_crash_guard(const std::function<void()>& func,
                                          const std::string& context = "");

} // namespace querylens::core
