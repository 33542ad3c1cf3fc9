//! # Monomorphizer Tests
//!
//! Instantiation of generic types and functions, deduplication, naming
//! through the shared registry, and the generic error cases.

#include "mono/monomorphizer.hpp"

#include <gtest/gtest.h>

using namespace a2c;
using namespace a2c::tree;
using types::make_generic;
using types::make_i32;
using types::make_named;

namespace {

/// `type List<T> { value: T, next: ref List<T> }`
auto make_list_decl() -> TypeDecl {
    return make_record("List",
                       {make_field_decl("value", make_generic("T")),
                        make_field_decl("next", types::make_indirect(
                                                    make_named("List", {make_generic("T")})))},
                       {"T"});
}

/// `fn identity<T>(x: T) -> T { x }`
auto make_identity() -> FuncDecl {
    return make_function("identity", {make_param("x", make_generic("T"))}, make_generic("T"),
                         make_block({}, make_var("x", make_generic("T")), make_generic("T")),
                         {"T"});
}

auto list_of(types::TypePtr element) -> types::TypePtr {
    return make_named("List", {std::move(element)});
}

} // namespace

class MonomorphizerTest : public ::testing::Test {
protected:
    ModuleUnit unit;
    mono::InstantiationRegistry registry;
    std::vector<mono::GenericInstantiation> table;

    void SetUp() override {
        unit.name = "lists";
    }

    auto run(std::vector<const ModuleUnit*> imports = {}) -> Result<LoweredModule, diag::Diagnostic> {
        mono::Monomorphizer mono(unit, registry, std::move(imports));
        auto result = mono.run();
        table = mono.instantiations();
        return result;
    }

    void add_user(const std::string& name, types::TypePtr param_type) {
        unit.functions.push_back(make_function(name, {make_param("l", std::move(param_type))},
                                               make_i32(), make_block({}, make_int_literal(0),
                                                                      make_i32())));
    }
};

// ============================================================================
// Generic Types
// ============================================================================

TEST_F(MonomorphizerTest, TwoInstantiationsOfOneContainer) {
    unit.types.push_back(make_list_decl());
    add_user("sum_ints", list_of(make_i32()));
    add_user("count_flags", list_of(types::make_bool()));

    auto result = run();
    ASSERT_TRUE(is_ok(result));
    auto& module = unwrap(result);

    EXPECT_EQ(module.find_type("List"), nullptr);
    const auto* ints = module.find_type("List_int");
    const auto* flags = module.find_type("List_bool");
    ASSERT_NE(ints, nullptr);
    ASSERT_NE(flags, nullptr);
    EXPECT_EQ(ints->generic_origin, "List<int>");
    EXPECT_EQ(flags->generic_origin, "List<bool>");
    EXPECT_FALSE(ints->is_generic());

    // Field types are substituted and self references point at the instance
    EXPECT_TRUE(types::types_equal(ints->fields[0].type, make_i32()));
    EXPECT_EQ(types::type_to_string(ints->fields[1].type), "ref List_int");

    // Parameters refer to the instances by name
    EXPECT_EQ(types::type_to_string(module.find_function("sum_ints")->params[0].type), "List_int");
    EXPECT_EQ(types::type_to_string(module.find_function("count_flags")->params[0].type),
              "List_bool");

    ASSERT_EQ(table.size(), 2u);
    EXPECT_TRUE(table[0].complete);
    EXPECT_TRUE(table[1].complete);
}

TEST_F(MonomorphizerTest, RepeatedRequestsShareOneInstance) {
    unit.types.push_back(make_list_decl());
    add_user("a", list_of(make_i32()));
    add_user("b", list_of(make_i32()));
    add_user("c", types::make_ptr(list_of(make_i32())));

    auto result = run();
    ASSERT_TRUE(is_ok(result));
    auto& module = unwrap(result);

    size_t instances = 0;
    for (const auto& decl : module.types) {
        if (decl.is_instance())
            ++instances;
    }
    EXPECT_EQ(instances, 1u);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(MonomorphizerTest, InstancesFollowPlainDeclarations) {
    unit.types.push_back(make_list_decl());
    unit.types.push_back(make_record("Holder", {make_field_decl("items", list_of(make_i32()))}));

    auto result = run();
    ASSERT_TRUE(is_ok(result));
    auto& module = unwrap(result);
    ASSERT_EQ(module.types.size(), 2u);
    EXPECT_EQ(module.types[0].name, "Holder");
    EXPECT_EQ(module.types[1].name, "List_int");
}

TEST_F(MonomorphizerTest, RunningTwiceGivesTheSameModule) {
    unit.types.push_back(make_list_decl());
    unit.functions.push_back(make_identity());
    add_user("use", list_of(make_i32()));

    auto first = run();
    auto second = run();
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));

    auto& a = unwrap(first);
    auto& b = unwrap(second);
    ASSERT_EQ(a.types.size(), b.types.size());
    for (size_t i = 0; i < a.types.size(); ++i) {
        EXPECT_EQ(a.types[i].name, b.types[i].name);
    }
    ASSERT_EQ(a.functions.size(), b.functions.size());
    EXPECT_EQ(registry.size(), 1u);
}

// ============================================================================
// Generic Functions
// ============================================================================

TEST_F(MonomorphizerTest, GenericCallIsRedirectedToInstance) {
    unit.functions.push_back(make_identity());
    unit.functions.push_back(make_function(
        "main", {}, make_i32(),
        make_block({}, make_call("identity", move_list<ExprPtr>(make_int_literal(3)), make_i32(),
                                 {make_i32()}),
                   make_i32())));

    auto result = run();
    ASSERT_TRUE(is_ok(result));
    auto& module = unwrap(result);

    EXPECT_EQ(module.find_function("identity"), nullptr);
    const auto* instance = module.find_function("identity_int");
    ASSERT_NE(instance, nullptr);
    EXPECT_EQ(instance->generic_origin, "identity<int>");
    EXPECT_TRUE(types::types_equal(instance->params[0].type, make_i32()));
    EXPECT_TRUE(types::types_equal(instance->return_type, make_i32()));

    const auto& call = module.find_function("main")->body->as<BlockExpr>().tail->as<CallExpr>();
    EXPECT_EQ(call.callee, "identity_int");
    EXPECT_TRUE(call.type_args.empty());
}

TEST_F(MonomorphizerTest, ImportedGenericIsInstantiatedLocally) {
    ModuleUnit lib;
    lib.name = "collections";
    lib.types.push_back(make_list_decl());

    add_user("use", list_of(make_i32()));
    unit.imports = {"collections"};

    auto result = run({&lib});
    ASSERT_TRUE(is_ok(result));
    EXPECT_NE(unwrap(result).find_type("List_int"), nullptr);
}

TEST_F(MonomorphizerTest, RegistryNamesAreSharedAcrossModules) {
    unit.types.push_back(make_list_decl());
    add_user("use", list_of(make_i32()));
    ASSERT_TRUE(is_ok(run()));

    ModuleUnit other;
    other.name = "other";
    other.functions.push_back(make_function("also", {make_param("l", list_of(make_i32()))},
                                            make_i32(),
                                            make_block({}, make_int_literal(1), make_i32())));
    mono::Monomorphizer mono(other, registry, {&unit});
    auto result = mono.run();
    ASSERT_TRUE(is_ok(result));
    EXPECT_NE(unwrap(result).find_type("List_int"), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(MonomorphizerTest, ContainingItselfByValueIsCyclic) {
    unit.types.push_back(
        make_record("Bad", {make_field_decl("inner", make_named("Bad", {make_generic("T")}))},
                    {"T"}));
    add_user("use", make_named("Bad", {make_i32()}));

    auto result = run();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::CyclicInstantiation);
}

TEST_F(MonomorphizerTest, GrowingInstantiationIsCyclic) {
    // type Grow<T> { next: ref Grow<Grow<T>> }
    unit.types.push_back(make_record(
        "Grow",
        {make_field_decl("next",
                         types::make_indirect(make_named(
                             "Grow", {make_named("Grow", {make_generic("T")})})))},
        {"T"}));
    add_user("use", make_named("Grow", {make_i32()}));

    auto result = run();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::CyclicInstantiation);
    EXPECT_NE(unwrap_err(result).message.find("grows without bound"), std::string::npos);
}

TEST_F(MonomorphizerTest, UnboundParameterIsUnresolved) {
    unit.functions.push_back(make_function("leak", {make_param("x", make_generic("T"))}, make_i32(),
                                           make_block({}, make_int_literal(0), make_i32())));

    auto result = run();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::UnresolvedGeneric);
    EXPECT_EQ(unwrap_err(result).symbol, "T");
}

TEST_F(MonomorphizerTest, GenericWithoutArgumentsIsUnresolved) {
    unit.types.push_back(make_list_decl());
    add_user("use", make_named("List"));

    auto result = run();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::UnresolvedGeneric);
}

TEST_F(MonomorphizerTest, WrongArgumentCountIsUnresolved) {
    unit.types.push_back(make_list_decl());
    add_user("use", make_named("List", {make_i32(), make_i32()}));

    auto result = run();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::UnresolvedGeneric);
}

TEST_F(MonomorphizerTest, InstanceNameClashingWithDeclarationCollides) {
    unit.types.push_back(make_list_decl());
    unit.types.push_back(make_record("List_int", {make_field_decl("x", make_i32())}));
    add_user("use", list_of(make_i32()));

    auto result = run();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::SymbolCollision);
    EXPECT_EQ(unwrap_err(result).symbol, "List_int");
}

TEST(InstantiationRegistryTest, DistinctKeysWithOneMangledNameCollide) {
    mono::InstantiationRegistry registry;
    auto first = registry.intern(mono::InstantiationKey{"Pair", {"a_b"}}, "m");
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first), "Pair_a_b");

    auto again = registry.intern(mono::InstantiationKey{"Pair", {"a_b"}}, "n");
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(unwrap(again), "Pair_a_b");

    auto clash = registry.intern(mono::InstantiationKey{"Pair_a", {"b"}}, "m");
    ASSERT_TRUE(is_err(clash));
    EXPECT_EQ(unwrap_err(clash).kind, diag::ErrorKind::SymbolCollision);
}

TEST(InstantiationRegistryTest, TypeArgumentCodes) {
    EXPECT_EQ(mono::type_arg_code(make_i32()), "int");
    EXPECT_EQ(mono::type_arg_code(types::make_ptr(make_named("Node"))), "ptr_Node");
    EXPECT_EQ(mono::type_arg_code(types::make_array(types::make_char(), 4)), "arr4_char");
    EXPECT_EQ(mono::mangle_instance(mono::InstantiationKey{"Map", {"str", "int"}}), "Map_str_int");
}
