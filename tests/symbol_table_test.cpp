//! # Symbol Table Tests
//!
//! Collection of `sym_name` definitions across nested regions.

#include "ir/ir.hpp"
#include "ir/symbol_table.hpp"

#include <gtest/gtest.h>

using namespace irt;
using namespace irt::ir;

namespace {

auto make_symbol(std::string name, std::string id, std::string sym) -> Operation {
    Operation op = make_op(std::move(name), std::move(id));
    op.attrs["sym_name"] = string_attr(std::move(sym));
    return op;
}

auto make_yield(std::string id) -> Operation {
    Operation op = make_op("test.yield", std::move(id));
    op.is_terminator = true;
    return op;
}

} // namespace

// ============================================================================
// SymbolTable
// ============================================================================

TEST(SymbolTableTest, InsertKeepsFirstDefinition) {
    Operation first = make_op("a", "0");
    Operation second = make_op("b", "1");

    SymbolTable table;
    EXPECT_TRUE(table.insert("f", &first));
    EXPECT_FALSE(table.insert("f", &second));

    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.lookup("f"), &first);
}

TEST(SymbolTableTest, LookupMissingReturnsNull) {
    SymbolTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.lookup("nothing"), nullptr);
}

// ============================================================================
// collect_symbols
// ============================================================================

class CollectSymbolsTest : public ::testing::Test {
protected:
    Module module;

    void SetUp() override {
        // @outer contains @inner_body in its body and @inner_term as the
        // terminator of a second block.
        Operation outer = make_symbol("test.func", "0", "outer");
        Operation term = make_symbol("test.yield", "3", "inner_term");
        term.is_terminator = true;
        outer.regions.push_back(make_region(
            make_block(make_yield("2"), {make_symbol("test.global", "1", "inner_body")}),
            {{"exit", make_block(std::move(term))}}));

        module.ops.push_back(std::move(outer));
        module.ops.push_back(make_symbol("test.func", "4", "second"));
        module.ops.push_back(make_op("test.anonymous", "5"));
    }
};

TEST_F(CollectSymbolsTest, FindsNestedDefinitions) {
    SymbolTable table = collect_symbols(module);

    EXPECT_EQ(table.size(), 4u);
    ASSERT_NE(table.lookup("outer"), nullptr);
    ASSERT_NE(table.lookup("inner_body"), nullptr);
    ASSERT_NE(table.lookup("inner_term"), nullptr);
    ASSERT_NE(table.lookup("second"), nullptr);

    EXPECT_EQ(table.lookup("outer")->id, "0");
    EXPECT_EQ(table.lookup("inner_body")->id, "1");
    EXPECT_EQ(table.lookup("inner_term")->id, "3");
    EXPECT_EQ(table.lookup("second"), &module.ops[1]);
}

TEST_F(CollectSymbolsTest, DuplicateSymbolKeepsFirst) {
    module.ops.push_back(make_symbol("test.func", "6", "outer"));

    SymbolTable table = collect_symbols(module);

    EXPECT_EQ(table.size(), 4u);
    EXPECT_EQ(table.lookup("outer")->id, "0");
}

TEST_F(CollectSymbolsTest, NonStringSymbolNameIgnored) {
    Operation op = make_op("test.func", "7");
    op.attrs["sym_name"] = int_attr(3);
    module.ops.push_back(std::move(op));

    SymbolTable table = collect_symbols(module);
    EXPECT_EQ(table.size(), 4u);
}

TEST(CollectSymbolsEmptyTest, EmptyModule) {
    Module module;
    EXPECT_TRUE(collect_symbols(module).empty());
}

// ============================================================================
// walk_operation
// ============================================================================

TEST(WalkOperationTest, VisitsPreOrderIncludingTerminators) {
    Operation inner = make_op("test.inner", "1");
    inner.regions.push_back(make_region(make_block(make_yield("2"))));

    Operation root = make_op("test.root", "0");
    root.regions.push_back(make_region(make_block(make_yield("3"), {std::move(inner)}),
                                       {{"next", make_block(make_yield("4"))}}));

    std::vector<std::string> visited;
    walk_operation(root, [&visited](const Operation& op) { visited.push_back(op.id); });

    EXPECT_EQ(visited, (std::vector<std::string>{"0", "1", "2", "3", "4"}));
}
