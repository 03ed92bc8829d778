// IR Builder - assembles Operations with caller-controlled identifiers
//
// An OpBuilder is a single construction session for one Operation. The
// caller supplies an environment and a pure generator function
//
//     Env -> (Env, std::string)
//
// which the builder invokes exactly once, in build(). The environment that
// build() hands back is the only valid input for the next session; threading
// it explicitly keeps identifier assignment deterministic without global
// counters.
//
// Example:
//
//     auto gen = counter_id_generator("%");
//     auto [env, cst] = OpBuilder<CounterEnv>("arith.constant", CounterEnv{}, gen)
//                           .with_result_types({make_i32_type()})
//                           .with_attrs({{"value", int_attr(42)}})
//                           .build();
//     // cst.id == "%0" and cst.results[0].name == "%0"

#pragma once

#include "ir/ir.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace irt::ir {

template <typename Env> using IdGenerator = std::function<std::pair<Env, std::string>(Env)>;

template <typename Env> struct BuildResult {
    Env env;
    Operation op;
};

template <typename Env> class OpBuilder {
public:
    OpBuilder(std::string name, Env env, IdGenerator<Env> gen)
        : name_(std::move(name)), env_(std::move(env)), gen_(std::move(gen)) {}

    // Each setter replaces the previous value of its field. The rvalue
    // overloads let a temporary builder be chained straight into build().
    auto with_operands(std::vector<std::string> operands) & -> OpBuilder& {
        operands_ = std::move(operands);
        return *this;
    }
    auto with_operands(std::vector<std::string> operands) && -> OpBuilder&& {
        return std::move(this->with_operands(std::move(operands)));
    }
    auto with_results(std::vector<NamedValue> results) & -> OpBuilder& {
        results_ = std::move(results);
        result_types_.reset();
        return *this;
    }
    auto with_results(std::vector<NamedValue> results) && -> OpBuilder&& {
        return std::move(this->with_results(std::move(results)));
    }
    // Declares results named after the generated id: `id` for a single
    // result, `id_0`, `id_1`, ... otherwise. Replaces with_results().
    auto with_result_types(std::vector<IrTypePtr> types) & -> OpBuilder& {
        results_.clear();
        result_types_ = std::move(types);
        return *this;
    }
    auto with_result_types(std::vector<IrTypePtr> types) && -> OpBuilder&& {
        return std::move(this->with_result_types(std::move(types)));
    }
    auto with_attrs(AttrMap attrs) & -> OpBuilder& {
        attrs_ = std::move(attrs);
        return *this;
    }
    auto with_attrs(AttrMap attrs) && -> OpBuilder&& {
        return std::move(this->with_attrs(std::move(attrs)));
    }
    auto with_regions(std::vector<Region> regions) & -> OpBuilder& {
        regions_ = std::move(regions);
        return *this;
    }
    auto with_regions(std::vector<Region> regions) && -> OpBuilder&& {
        return std::move(this->with_regions(std::move(regions)));
    }
    auto is_terminator(bool terminator = true) & -> OpBuilder& {
        is_terminator_ = terminator;
        return *this;
    }
    auto is_terminator(bool terminator = true) && -> OpBuilder&& {
        return std::move(this->is_terminator(terminator));
    }
    auto with_loc(SourceSpan loc) & -> OpBuilder& {
        loc_ = std::move(loc);
        return *this;
    }
    auto with_loc(SourceSpan loc) && -> OpBuilder&& {
        return std::move(this->with_loc(std::move(loc)));
    }
    auto with_successors(std::vector<std::string> successors) & -> OpBuilder& {
        successors_ = std::move(successors);
        return *this;
    }
    auto with_successors(std::vector<std::string> successors) && -> OpBuilder&& {
        return std::move(this->with_successors(std::move(successors)));
    }

    // Consumes the session. No consistency checks are performed.
    [[nodiscard]] auto build() && -> BuildResult<Env> {
        auto [next_env, id] = gen_(std::move(env_));

        Operation op;
        op.name = std::move(name_);
        op.id = std::move(id);
        op.operands = std::move(operands_);
        if (result_types_) {
            for (size_t i = 0; i < result_types_->size(); ++i) {
                std::string name = result_types_->size() == 1 ? op.id
                                                              : op.id + "_" + std::to_string(i);
                op.results.push_back(NamedValue{std::move(name), (*result_types_)[i]});
            }
        } else {
            op.results = std::move(results_);
        }
        op.attrs = std::move(attrs_);
        op.regions = std::move(regions_);
        op.is_terminator = is_terminator_;
        op.loc = std::move(loc_);
        op.successors = std::move(successors_);

        return BuildResult<Env>{std::move(next_env), std::move(op)};
    }

private:
    std::string name_;
    Env env_;
    IdGenerator<Env> gen_;

    std::vector<std::string> operands_;
    std::vector<NamedValue> results_;
    std::optional<std::vector<IrTypePtr>> result_types_;
    AttrMap attrs_;
    std::vector<Region> regions_;
    bool is_terminator_ = false;
    SourceSpan loc_;
    std::vector<std::string> successors_;
};

// ============================================================================
// Counter Environment
// ============================================================================

// Move-only identifier counter. Copying requires an explicit clone(), so a
// stale environment cannot be reused by accident.
class CounterEnv {
public:
    CounterEnv() = default;
    explicit CounterEnv(uint64_t next) : next_(next) {}

    CounterEnv(const CounterEnv&) = delete;
    auto operator=(const CounterEnv&) -> CounterEnv& = delete;
    CounterEnv(CounterEnv&&) noexcept = default;
    auto operator=(CounterEnv&&) noexcept -> CounterEnv& = default;

    [[nodiscard]] auto next() const -> uint64_t {
        return next_;
    }

    [[nodiscard]] auto clone() const -> CounterEnv {
        return CounterEnv(next_);
    }

private:
    uint64_t next_ = 0;
};

// Generator producing prefix0, prefix1, ... from a CounterEnv.
auto counter_id_generator(std::string prefix) -> IdGenerator<CounterEnv>;

} // namespace irt::ir
