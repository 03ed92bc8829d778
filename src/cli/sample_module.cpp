//! # Sample Module Construction
//!
//! Each operation is produced by one OpBuilder session; the CounterEnv
//! returned by a session feeds the next one, so value names come out as
//! %0, %1, ... in construction order.

#include "sample_module.hpp"

#include "ir/ir_builder.hpp"

namespace irt::cli {

using namespace irt::ir;

namespace {

// Tracks the identifier environment across builder sessions.
class SampleBuilder {
public:
    explicit SampleBuilder(std::string file)
        : file_(std::move(file)), gen_(counter_id_generator("%")) {}

    auto op(const std::string& name) -> OpBuilder<CounterEnv> {
        return OpBuilder<CounterEnv>(name, std::move(env_), gen_).with_loc(next_loc());
    }

    auto finish(OpBuilder<CounterEnv>&& builder) -> Operation {
        auto [env, built] = std::move(builder).build();
        env_ = std::move(env);
        return std::move(built);
    }

private:
    std::string file_;
    CounterEnv env_;
    IdGenerator<CounterEnv> gen_;
    uint32_t row_ = 1;

    auto next_loc() -> SourceSpan {
        SourceSpan loc{file_, {row_, 0}, {row_, 1}};
        ++row_;
        return loc;
    }
};

auto tensor4() -> IrTypePtr {
    return make_tensor_type({Dim::fixed(4)}, make_f64_type());
}

auto add_bias_func(SampleBuilder& b) -> Operation {
    Operation bias = b.finish(b.op("arith.constant")
                                  .with_result_types({tensor4()})
                                  .with_attrs({{"value", dense_attr({4}, dense_vector({0.5, -0.5, 1.0,
                                                                                       2.0}))}}));
    Operation sum = b.finish(b.op("arith.addf")
                                 .with_operands({"%x", bias.results[0].name})
                                 .with_result_types({tensor4()}));
    Operation ret = b.finish(b.op("func.return").with_operands({sum.id}).is_terminator());

    Block entry = make_block(std::move(ret), {std::move(bias), std::move(sum)},
                             {{"%x", tensor4()}});

    return b.finish(b.op("func.func")
                        .with_regions({make_region(std::move(entry))})
                        .with_attrs({
                            {"sym_name", string_attr("add_bias")},
                            {"function_type",
                             type_attr(make_function_type({tensor4()}, {tensor4()}))},
                            {"sym_visibility", visibility_attr(Visibility::Private)},
                        }));
}

auto select_func(SampleBuilder& b) -> Operation {
    auto i1 = make_i1_type();
    auto i32 = make_i32_type();

    Operation branch = b.finish(b.op("cf.cond_br")
                                    .with_operands({"%cond"})
                                    .with_successors({"then", "else"})
                                    .is_terminator());
    Block entry = make_block(std::move(branch), {}, {{"%cond", i1}, {"%a", i32}, {"%b", i32}});

    Operation one = b.finish(
        b.op("arith.constant").with_result_types({i32}).with_attrs({{"value", int_attr(1, i32)}}));
    Operation then_ret = b.finish(b.op("func.return").with_operands({one.id}).is_terminator());
    Block then_block = make_block(std::move(then_ret), {std::move(one)});

    Operation zero = b.finish(
        b.op("arith.constant").with_result_types({i32}).with_attrs({{"value", int_attr(0, i32)}}));
    Operation else_ret = b.finish(b.op("func.return").with_operands({zero.id}).is_terminator());
    Block else_block = make_block(std::move(else_ret), {std::move(zero)});

    Region body = make_region(std::move(entry));
    body.blocks.emplace_back("then", std::move(then_block));
    body.blocks.emplace_back("else", std::move(else_block));

    return b.finish(b.op("func.func")
                        .with_regions({std::move(body)})
                        .with_attrs({
                            {"sym_name", string_attr("select")},
                            {"function_type", type_attr(make_function_type({i1, i32, i32}, {i32}))},
                        }));
}

auto main_func(SampleBuilder& b) -> Operation {
    Operation input = b.finish(b.op("arith.constant")
                                   .with_result_types({tensor4()})
                                   .with_attrs({{"value", dense_attr({4}, dense_scalar(1.0))}}));
    Operation call = b.finish(b.op("func.call")
                                  .with_operands({input.id})
                                  .with_result_types({tensor4()})
                                  .with_attrs({{"callee", symbol_ref_attr("add_bias")}}));
    Operation ret = b.finish(b.op("func.return").is_terminator());

    Block entry = make_block(std::move(ret), {std::move(input), std::move(call)});

    return b.finish(b.op("func.func")
                        .with_regions({make_region(std::move(entry))})
                        .with_attrs({
                            {"sym_name", string_attr("main")},
                            {"function_type", type_attr(make_function_type({}, {}))},
                            {"llvm.emit_c_interface", unit_attr()},
                        }));
}

} // namespace

auto build_sample_module(const std::string& file) -> Module {
    SampleBuilder b(file);

    Module module;
    module.ops.push_back(add_bias_func(b));
    module.ops.push_back(select_func(b));
    module.ops.push_back(main_func(b));
    module.loc = SourceSpan::merge(module.ops.front().loc, module.ops.back().loc);
    return module;
}

} // namespace irt::cli
