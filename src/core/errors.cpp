#include "core/errors.hpp"

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:               return "none";
        case FailureKind::InvalidInput:       return "invalid input";
        case FailureKind::NotFound:           return "not found";
        case FailureKind::DuplicateName:      return "duplicate name";
        case FailureKind::StorageError:       return "storage error";
        case FailureKind::ConfigNotFound:     return "config not found";
        case FailureKind::AuthFailed:         return "authentication failed";
        case FailureKind::EngineError:        return "engine error";
        case FailureKind::NoActiveConnection: return "no active connection";
        case FailureKind::AlreadyConnected:   return "already connected";
        case FailureKind::Cancelled:          return "cancelled";
    }
    return "unknown";
}

int exit_code_for(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:               return 0;
        case FailureKind::InvalidInput:       return 2;
        case FailureKind::NotFound:           return 3;
        case FailureKind::DuplicateName:      return 4;
        case FailureKind::StorageError:       return 5;
        case FailureKind::ConfigNotFound:     return 6;
        case FailureKind::AuthFailed:         return 7;
        case FailureKind::EngineError:        return 8;
        case FailureKind::NoActiveConnection: return 9;
        case FailureKind::AlreadyConnected:   return 10;
        case FailureKind::Cancelled:          return 130;
    }
    return 1;
}
