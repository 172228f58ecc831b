#include "core/fault.hpp"

const char* faultName(FaultKind kind) {
    switch (kind) {
        case FaultKind::DeviceUnavailable:        return "DeviceUnavailable";
        case FaultKind::DeviceLost:               return "DeviceLost";
        case FaultKind::RecorderSpawnFailed:      return "RecorderSpawnFailed";
        case FaultKind::RecorderExitedAbnormally: return "RecorderExitedAbnormally";
        case FaultKind::TranscriptionFailed:      return "TranscriptionFailed";
        case FaultKind::TranscriptionTimedOut:    return "TranscriptionTimedOut";
        case FaultKind::AcceleratorUnavailable:   return "AcceleratorUnavailable";
        case FaultKind::InjectorMissing:          return "InjectorMissing";
        case FaultKind::InjectorSocketMissing:    return "InjectorSocketMissing";
        case FaultKind::InjectionFailed:          return "InjectionFailed";
        case FaultKind::ConfigInvalid:            return "ConfigInvalid";
        case FaultKind::UserUnknown:              return "UserUnknown";
        case FaultKind::Cancelled:                return "Cancelled";
    }
    return "Unknown";
}

FaultClass faultClass(FaultKind kind) {
    switch (kind) {
        case FaultKind::DeviceUnavailable:
        case FaultKind::DeviceLost:
            return FaultClass::Device;
        case FaultKind::AcceleratorUnavailable:
        case FaultKind::ConfigInvalid:
            return FaultClass::Configuration;
        case FaultKind::UserUnknown:
            return FaultClass::Startup;
        default:
            return FaultClass::Session;
    }
}

std::string Fault::describe() const {
    if (detail.empty()) return faultName(kind);
    return std::string(faultName(kind)) + ": " + detail;
}
