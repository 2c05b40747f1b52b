/**
 * @file execution_types.cpp
 * @brief Display names for execution enums
 * 
 * @date 2025
 */

#include "capsule/core/execution_types.hpp"

namespace capsule {
namespace core {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:            return "none";
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
        case ErrorKind::COMPILE:         return "compile";
        case ErrorKind::RUNTIME:         return "runtime";
        case ErrorKind::TIMEOUT:         return "timeout";
        case ErrorKind::RESOURCE_LIMIT:  return "resource_limit";
        case ErrorKind::INTERNAL:        return "internal";
    }
    return "unknown";
}

const char* ToString(RunState state) {
    switch (state) {
        case RunState::COMPILING: return "compiling";
        case RunState::RUNNING:   return "running";
        case RunState::COMPLETED: return "completed";
        case RunState::FAILED:    return "failed";
        case RunState::TIMED_OUT: return "timed_out";
    }
    return "unknown";
}

} // namespace core
} // namespace capsule
