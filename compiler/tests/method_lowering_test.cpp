//! # Method Lowering Tests

#include "lower/method_lowering.hpp"
#include "ownership/classifier.hpp"

#include <gtest/gtest.h>

using namespace a2c;
using namespace a2c::tree;
using types::make_i32;
using types::make_named;
using types::make_unit;

namespace {

auto point_type() -> TypePtr {
    return make_named("Point");
}

/// `type Point { x: int, y: int }` with `sum()` and static `origin()`.
auto make_point() -> TypeDecl {
    auto point = make_record("Point", {make_field_decl("x", make_i32()),
                                       make_field_decl("y", make_i32())});
    point.methods.push_back(make_method(
        "sum", {}, make_i32(),
        make_block({},
                   make_binary(BinOp::Add, make_self_field("x", make_i32()),
                               make_self_field("y", make_i32()), make_i32()),
                   make_i32())));
    point.methods.push_back(make_static_method(
        "origin", {}, point_type(),
        make_block({},
                   make_struct(point_type(),
                               move_list<FieldInit>(FieldInit{"x", make_int_literal(0)},
                                                    FieldInit{"y", make_int_literal(0)})),
                   point_type())));
    return point;
}

} // namespace

class MethodLoweringTest : public ::testing::Test {
protected:
    LoweredModule module;
    layout::LayoutTable layouts;
    lower::SymbolTable symbols{"geo"};

    void SetUp() override {
        module.name = "geo";
        module.types.push_back(make_point());
    }

    /// `fn main() -> int { let p = Point.origin(); p.sum() }`
    void add_main() {
        module.functions.push_back(make_function(
            "main", {}, make_i32(),
            make_block(move_list<StmtPtr>(make_let(
                           "p", point_type(),
                           make_static_call(point_type(), "origin", {}, point_type()))),
                       make_method_call(make_var("p", point_type()), point_type(), "sum", {},
                                        make_i32()),
                       make_i32())));
    }

    /// Layout and classification, as the pipeline runs them before lowering.
    void prepare() {
        DeclIndex index(module);
        layout::LayoutCompiler compiler(index);
        auto table = compiler.run();
        ASSERT_TRUE(is_ok(table));
        layouts = std::move(unwrap(table));

        ownership::OwnershipClassifier classifier(module, index);
        ASSERT_TRUE(is_ok(classifier.run()));
    }

    auto lower() -> Result<Unit, diag::Diagnostic> {
        lower::MethodLowering lowering(module, layouts, symbols);
        return lowering.run();
    }
};

TEST_F(MethodLoweringTest, MethodsBecomeFreeFunctions) {
    add_main();
    prepare();
    ASSERT_TRUE(is_ok(lower()));

    ASSERT_EQ(module.functions.size(), 3u);
    EXPECT_EQ(module.functions[0].name, "Point_sum");
    EXPECT_EQ(module.functions[1].name, "Point_origin");
    EXPECT_EQ(module.functions[2].name, "main");
    EXPECT_TRUE(module.find_type("Point")->methods.empty());

    const auto& sum = module.functions[0];
    EXPECT_EQ(sum.owner_type, "Point");
    ASSERT_EQ(sum.params.size(), 1u);
    EXPECT_EQ(sum.params[0].name, "self");
    EXPECT_EQ(sum.params[0].passing, PassingMode::RefImmutable);
    EXPECT_TRUE(module.functions[1].params.empty());
}

TEST_F(MethodLoweringTest, FieldShorthandReadsThroughSelf) {
    prepare();
    ASSERT_TRUE(is_ok(lower()));

    const auto& body = module.find_function("Point_sum")->body->as<BlockExpr>();
    const auto& sum = body.tail->as<BinaryExpr>();
    ASSERT_TRUE(sum.left->is<FieldExpr>());
    const auto& field = sum.left->as<FieldExpr>();
    EXPECT_EQ(field.field, "x");
    ASSERT_TRUE(field.object->is<VarExpr>());
    EXPECT_EQ(field.object->as<VarExpr>().name, "self");
}

TEST_F(MethodLoweringTest, CallsBecomeDirectCalls) {
    add_main();
    prepare();
    ASSERT_TRUE(is_ok(lower()));

    const auto& body = module.find_function("main")->body->as<BlockExpr>();

    const auto& origin = body.stmts[0]->as<LetStmt>().init->as<CallExpr>();
    EXPECT_EQ(origin.callee, "Point_origin");
    EXPECT_TRUE(origin.args.empty());

    const auto& sum = body.tail->as<CallExpr>();
    EXPECT_EQ(sum.callee, "Point_sum");
    ASSERT_EQ(sum.args.size(), 1u);
    EXPECT_EQ(sum.args[0]->as<VarExpr>().name, "p");
}

TEST_F(MethodLoweringTest, EveryTopLevelNameIsRegistered) {
    module.types.push_back(make_tag(
        "Shape", {make_variant_decl("Circle", {make_field_decl("r", make_i32())}),
                  make_variant_decl("Empty")}));
    module.functions.push_back(make_function("area", {}, make_i32(), nullptr));
    add_main();
    prepare();
    ASSERT_TRUE(is_ok(lower()));

    ASSERT_NE(symbols.find("Point"), nullptr);
    EXPECT_EQ(symbols.find("Point")->kind, lower::SymbolKind::Type);
    EXPECT_EQ(symbols.find("ShapeKind")->kind, lower::SymbolKind::TagEnum);
    EXPECT_EQ(symbols.find("SHAPE_CIRCLE")->kind, lower::SymbolKind::EnumConstant);
    EXPECT_EQ(symbols.find("SHAPE_CIRCLE")->owner, "Shape.Circle");
    EXPECT_EQ(symbols.find("Point_sum")->kind, lower::SymbolKind::Function);
    EXPECT_EQ(symbols.find("Point_sum")->owner, "Point");
    EXPECT_EQ(symbols.find("area")->kind, lower::SymbolKind::ExternFunction);
    EXPECT_TRUE(symbols.contains("main"));
}

TEST_F(MethodLoweringTest, LoweredNameClashingWithFunctionCollides) {
    module.functions.push_back(
        make_function("Point_sum", {}, make_i32(), make_block({}, make_int_literal(0), make_i32())));
    prepare();

    auto result = lower();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::SymbolCollision);
    EXPECT_EQ(unwrap_err(result).symbol, "Point_sum");
}

TEST_F(MethodLoweringTest, UnknownMethodIsMalformed) {
    module.functions.push_back(make_function(
        "main", {make_param("p", point_type())}, make_i32(),
        make_block({}, make_method_call(make_var("p", point_type()), point_type(), "norm", {},
                                        make_i32()),
                   make_i32())));
    prepare();

    auto result = lower();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::MalformedTree);
    EXPECT_NE(unwrap_err(result).message.find("no method 'norm'"), std::string::npos);
}

TEST_F(MethodLoweringTest, UnclassifiedModuleIsRejected) {
    auto result = lower();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::Internal);
}

TEST(SymbolTableTest, SecondRegistrationCollides) {
    lower::SymbolTable table("m");
    ASSERT_TRUE(is_ok(table.add(lower::EmittedSymbol{"f", lower::SymbolKind::Function, "f", ""})));

    auto again = table.add(lower::EmittedSymbol{"f", lower::SymbolKind::Type, "f", ""});
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, diag::ErrorKind::SymbolCollision);
    EXPECT_EQ(unwrap_err(again).module, "m");

    table.set_decl_text("f", "int f(void)");
    EXPECT_EQ(table.find("f")->decl_text, "int f(void)");
    EXPECT_EQ(table.size(), 1u);
}
