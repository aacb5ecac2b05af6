#pragma once

#include <QString>
#include <utility>

namespace pem {

enum class ErrorKind {
    None,
    Network,    // unreachable host, timeout, transport or HTTP failure
    Protocol,   // non-success code/state, schema mismatch, malformed JSON
    Io,         // create/read/write/rename/delete failure
    NotFound    // operation targets a local file or entry that does not exist
};

inline const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Network: return "network";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::Io: return "io";
    case ErrorKind::NotFound: return "not-found";
    }
    return "unknown";
}

/// Outcome of an operation that produces no value.
struct Status {
    ErrorKind kind = ErrorKind::None;
    QString message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return {}; }
    static Status failure(ErrorKind kind, QString message)
    {
        return Status{kind, std::move(message)};
    }
};

/// Outcome of an operation that produces a value. `value` is default-constructed
/// when the status is not ok.
template <typename T>
struct Result {
    T value{};
    Status status;

    bool ok() const { return status.ok(); }

    static Result success(T value) { return Result{std::move(value), Status::success()}; }
    static Result failure(Status status) { return Result{T{}, std::move(status)}; }
    static Result failure(ErrorKind kind, QString message)
    {
        return failure(Status::failure(kind, std::move(message)));
    }
};

} // namespace pem
