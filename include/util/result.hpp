#pragma once
#include <string>
#include <utility>

namespace canister {

enum class ErrorKind : int {
    None = 0,
    Validation,
    Transport,
    Protocol,
    Cancelled,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .msg = std::move(m)};
    }
};

// Prefixes the message with context, keeping the error kind.
inline Result Wrap(const Result& r, const std::string& context) {
    if (r.ok)
        return r;
    return Result::Fail(r.kind, context + ": " + r.msg);
}

// Only transport failures of idempotent calls can be replayed blindly.
inline bool IsRetryable(const Result& r, bool idempotent) {
    return !r.ok && r.kind == ErrorKind::Transport && idempotent;
}

} // namespace canister
