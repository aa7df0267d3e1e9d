/**
 * @file types.cpp
 * @brief String conversions for the common enums
 */

#include "types.h"

namespace hud_advisor {

const char* toString(ActionKind kind) {
    switch (kind) {
        case ActionKind::Fold:          return "Fold";
        case ActionKind::Raise:         return "Raise";
        case ActionKind::Call:          return "Call";
        case ActionKind::Check:         return "Check";
        case ActionKind::AllIn:         return "AllIn";
        case ActionKind::Ready:         return "Ready";
        case ActionKind::Waiting:       return "Waiting";
        case ActionKind::Skip:          return "Skip";
        case ActionKind::Unrecognized:  return "Unrecognized";
    }
    return "Unrecognized";
}

const char* toString(Confidence confidence) {
    switch (confidence) {
        case Confidence::High:   return "High";
        case Confidence::Medium: return "Medium";
        case Confidence::Low:    return "Low";
    }
    return "Low";
}

const char* toString(Phase phase) {
    switch (phase) {
        case Phase::Waiting: return "Waiting";
        case Phase::Ready:   return "Ready";
        case Phase::Acting:  return "Acting";
    }
    return "Waiting";
}

} // namespace hud_advisor
