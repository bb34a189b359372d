#pragma once

#include "agent/principal.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace canister {

// Finalized request handed to the transport. Immutable once built.
class CallDescriptor {
public:
    const Principal& Target() const { return target_; }
    const std::string& Method() const { return method_; }
    const std::vector<std::uint8_t>& Arg() const { return arg_; }
    const Principal& EffectiveCanisterId() const { return effective_canister_id_; }

private:
    friend class CallBuilder;

    CallDescriptor(Principal target,
                   std::string method,
                   std::vector<std::uint8_t> arg,
                   Principal effective_canister_id)
        : target_(std::move(target)),
          method_(std::move(method)),
          arg_(std::move(arg)),
          effective_canister_id_(std::move(effective_canister_id)) {}

    Principal target_;
    std::string method_;
    std::vector<std::uint8_t> arg_;
    Principal effective_canister_id_;
};

class CallBuilder {
public:
    CallBuilder(Principal target, std::string method);

    CallBuilder& WithArg(std::vector<std::uint8_t> arg);

    // Routes the call by a different identity than the receiving canister.
    CallBuilder& WithEffectiveCanisterId(Principal id);

    // Fails with a validation error when no method name was given.
    Result Build(std::optional<CallDescriptor>& out) const;

private:
    Principal target_;
    std::string method_;
    std::vector<std::uint8_t> arg_;
    std::optional<Principal> effective_canister_id_;
};

} // namespace canister
