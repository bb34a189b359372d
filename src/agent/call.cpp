#include "agent/call.hpp"

namespace canister {

CallBuilder::CallBuilder(Principal target, std::string method)
    : target_(std::move(target)), method_(std::move(method)) {}

CallBuilder& CallBuilder::WithArg(std::vector<std::uint8_t> arg) {
    arg_ = std::move(arg);
    return *this;
}

CallBuilder& CallBuilder::WithEffectiveCanisterId(Principal id) {
    effective_canister_id_ = std::move(id);
    return *this;
}

Result CallBuilder::Build(std::optional<CallDescriptor>& out) const {
    if (method_.empty())
        return Result::Fail(ErrorKind::Validation, "call has no method name");

    out.emplace(CallDescriptor(target_,
                               method_,
                               arg_,
                               effective_canister_id_.value_or(target_)));
    return Result::Ok();
}

} // namespace canister
