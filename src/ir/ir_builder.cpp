//! # IR Builder Support
//!
//! The counter-based identifier generator used by frontends that do not need
//! their own naming scheme.

#include "ir/ir_builder.hpp"

#include "log/log.hpp"

namespace irt::ir {

auto counter_id_generator(std::string prefix) -> IdGenerator<CounterEnv> {
    return [prefix = std::move(prefix)](CounterEnv env) -> std::pair<CounterEnv, std::string> {
        uint64_t n = env.next();
        std::string id = prefix + std::to_string(n);
        IRT_LOG_TRACE("builder", "Assigned id " << id);
        return {CounterEnv(n + 1), std::move(id)};
    };
}

} // namespace irt::ir
