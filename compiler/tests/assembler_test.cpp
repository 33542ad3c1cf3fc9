//! # Fragment Assembler Tests
//!
//! Merge order, stub filling, conflicts, scenario filtering and the
//! missing-fragment cases.

#include "assemble/assembler.hpp"

#include <gtest/gtest.h>

using namespace a2c;
using namespace a2c::tree;

namespace {

auto int_body(int64_t value) -> ExprPtr {
    return make_block({}, make_int_literal(value), types::make_i32());
}

auto fragment(const std::string& module) -> Fragment {
    Fragment f;
    f.module = module;
    return f;
}

} // namespace

class AssemblerTest : public ::testing::Test {
protected:
    assemble::MemoryFragmentProvider provider;

    auto assemble(const std::string& module, Scenario scenario = Scenario::TransC)
        -> Result<ModuleUnit, diag::Diagnostic> {
        assemble::Assembler assembler(provider);
        return assembler.assemble(module, scenario);
    }
};

// ============================================================================
// Merge Order
// ============================================================================

TEST_F(AssemblerTest, SpecificDeclarationsComeFirst) {
    auto shared = fragment("geo");
    shared.types.push_back(make_record("Point", {make_field_decl("x", types::make_i32())}));
    shared.functions.push_back(make_function("shared_fn", {}, types::make_i32(), int_body(1)));
    provider.add_shared(std::move(shared));

    auto specific = fragment("geo");
    specific.functions.push_back(make_function("c_fn", {}, types::make_i32(), int_body(2)));
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("geo");
    ASSERT_TRUE(is_ok(result));
    auto& unit = unwrap(result);
    EXPECT_EQ(unit.name, "geo");
    EXPECT_EQ(unit.scenario, Scenario::TransC);
    ASSERT_EQ(unit.functions.size(), 2u);
    EXPECT_EQ(unit.functions[0].name, "c_fn");
    EXPECT_EQ(unit.functions[1].name, "shared_fn");
    ASSERT_EQ(unit.types.size(), 1u);
    EXPECT_EQ(unit.types[0].name, "Point");
}

TEST_F(AssemblerTest, MergedDeclarationKeepsSpecificPosition) {
    auto shared = fragment("m");
    shared.functions.push_back(make_function("first", {}, types::make_i32(), int_body(1)));
    shared.functions.push_back(make_function("second", {}, types::make_i32(), nullptr));
    provider.add_shared(std::move(shared));

    auto specific = fragment("m");
    specific.functions.push_back(make_function("second", {}, types::make_i32(), int_body(2)));
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("m");
    ASSERT_TRUE(is_ok(result));
    auto& unit = unwrap(result);
    ASSERT_EQ(unit.functions.size(), 2u);
    EXPECT_EQ(unit.functions[0].name, "second");
    EXPECT_FALSE(unit.functions[0].is_stub());
    EXPECT_EQ(unit.functions[1].name, "first");
}

TEST_F(AssemblerTest, ImportsAreMergedWithoutDuplicates) {
    auto shared = fragment("app");
    shared.imports = {"geo", "text"};
    provider.add_shared(std::move(shared));

    auto specific = fragment("app");
    specific.imports = {"libc", "geo"};
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("app");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).imports, (std::vector<std::string>{"libc", "geo", "text"}));
}

// ============================================================================
// Stubs
// ============================================================================

TEST_F(AssemblerTest, OpaqueTypeTakesStructureFromOtherFragment) {
    auto shared = fragment("buf");
    auto opaque = make_opaque("Buffer");
    opaque.methods.push_back(make_method("size", {}, types::make_i32(), int_body(0)));
    shared.types.push_back(std::move(opaque));
    provider.add_shared(std::move(shared));

    auto specific = fragment("buf");
    auto record = make_record("Buffer", {make_field_decl("len", types::make_i32())});
    record.methods.push_back(make_method("size", {}, types::make_i32(), nullptr));
    specific.types.push_back(std::move(record));
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("buf");
    ASSERT_TRUE(is_ok(result));
    auto& unit = unwrap(result);
    const auto* buffer = unit.find_type("Buffer");
    ASSERT_NE(buffer, nullptr);
    EXPECT_FALSE(buffer->is_opaque);
    ASSERT_EQ(buffer->fields.size(), 1u);
    EXPECT_EQ(buffer->fields[0].name, "len");
    const auto* size = buffer->find_method("size");
    ASSERT_NE(size, nullptr);
    EXPECT_FALSE(size->is_stub());
}

TEST_F(AssemblerTest, SharedFragmentAloneIsEnough) {
    auto shared = fragment("solo");
    shared.functions.push_back(make_function("f", {}, types::make_i32(), int_body(7)));
    provider.add_shared(std::move(shared));

    auto result = assemble("solo", Scenario::TransRust);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).functions.size(), 1u);
}

// ============================================================================
// Scenario Filtering
// ============================================================================

TEST_F(AssemblerTest, DeclarationsForOtherScenariosAreDropped) {
    auto shared = fragment("m");
    auto vm_only = make_function("vm_helper", {}, types::make_i32(), int_body(1));
    vm_only.only_for = Scenario::Interp;
    auto c_only = make_function("c_helper", {}, types::make_i32(), int_body(2));
    c_only.only_for = Scenario::TransC;
    shared.functions.push_back(std::move(vm_only));
    shared.functions.push_back(std::move(c_only));
    provider.add_shared(std::move(shared));

    auto result = assemble("m");
    ASSERT_TRUE(is_ok(result));
    auto& unit = unwrap(result);
    EXPECT_EQ(unit.find_function("vm_helper"), nullptr);
    EXPECT_NE(unit.find_function("c_helper"), nullptr);
}

// ============================================================================
// Conflicts
// ============================================================================

TEST_F(AssemblerTest, StructureInBothFragmentsConflicts) {
    auto shared = fragment("m");
    shared.types.push_back(make_record("P", {make_field_decl("x", types::make_i32())}));
    provider.add_shared(std::move(shared));

    auto specific = fragment("m");
    specific.types.push_back(make_record("P", {make_field_decl("y", types::make_i32())}));
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("m");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::AssemblyConflict);
    EXPECT_EQ(unwrap_err(result).symbol, "P");
}

TEST_F(AssemblerTest, TwoBodiesConflict) {
    auto shared = fragment("m");
    shared.functions.push_back(make_function("f", {}, types::make_i32(), int_body(1)));
    provider.add_shared(std::move(shared));

    auto specific = fragment("m");
    specific.functions.push_back(make_function("f", {}, types::make_i32(), int_body(2)));
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("m");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::AssemblyConflict);
}

TEST_F(AssemblerTest, DifferentSignaturesConflict) {
    auto shared = fragment("m");
    shared.functions.push_back(make_function("f", {make_param("a", types::make_i32())},
                                             types::make_i32(), nullptr));
    provider.add_shared(std::move(shared));

    auto specific = fragment("m");
    specific.functions.push_back(make_function("f", {make_param("a", types::make_i64())},
                                               types::make_i32(), int_body(2)));
    provider.add_specific(Scenario::TransC, std::move(specific));

    auto result = assemble("m");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::AssemblyConflict);
    EXPECT_NE(unwrap_err(result).message.find("differs"), std::string::npos);
}

TEST_F(AssemblerTest, DuplicateInsideOneFragmentConflicts) {
    auto shared = fragment("m");
    shared.functions.push_back(make_function("f", {}, types::make_i32(), int_body(1)));
    shared.functions.push_back(make_function("f", {}, types::make_i32(), nullptr));
    provider.add_shared(std::move(shared));

    auto result = assemble("m");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::AssemblyConflict);
    EXPECT_NE(unwrap_err(result).message.find("declared twice"), std::string::npos);
}

TEST_F(AssemblerTest, MissingModuleIsNotFound) {
    auto result = assemble("nowhere");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::ModuleNotFound);
    EXPECT_EQ(unwrap_err(result).module, "nowhere");
}
