#pragma once

#include "agent/call.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <vector>

namespace canister {

// Submits a call and waits for its certified reply.
//
// Implementations report ErrorKind::Transport when the call did not complete and
// ErrorKind::Protocol when the host rejected it. They must be callable from several
// threads at once when the orchestrator uploads with parallelism above one.
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual Result Call(const CallDescriptor& call, std::vector<std::uint8_t>& reply) = 0;
};

} // namespace canister
