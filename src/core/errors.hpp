#pragma once

#include <string>

enum class FailureKind {
    None,
    InvalidInput,
    NotFound,
    DuplicateName,
    StorageError,
    ConfigNotFound,
    AuthFailed,
    EngineError,
    NoActiveConnection,
    AlreadyConnected,
    Cancelled,
};

/// Outcome of a store, orchestrator or facade operation.
struct OpResult {
    bool success = true;
    FailureKind kind = FailureKind::None;
    std::string error;

    static OpResult ok() { return OpResult{}; }
    static OpResult fail(FailureKind kind, std::string error) {
        OpResult r;
        r.success = false;
        r.kind = kind;
        r.error = std::move(error);
        return r;
    }
};

const char* to_string(FailureKind kind);

/// Process exit code for a command that ended with the given kind
int exit_code_for(FailureKind kind);
