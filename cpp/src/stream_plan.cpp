#include "../include/stream_plan.hpp"

namespace psrelay {
namespace core {

const char* to_string(CaptureStrategy strategy) noexcept {
    switch (strategy) {
        case CaptureStrategy::DirectPipe: return "direct-pipe";
        case CaptureStrategy::FileRelay:  return "file-relay";
    }
    return "?";
}

StreamPlan StreamPlan::decide(bool elevate, const InterpreterCapabilities& caps) noexcept {
    StreamPlan plan;
    plan.elevated = elevate;
    if (elevate && !caps.supportsDirectRedirectWithElevation) {
        plan.strategy = CaptureStrategy::FileRelay;
    } else {
        plan.strategy = CaptureStrategy::DirectPipe;
    }
    return plan;
}

} // namespace core
} // namespace psrelay
