//! # C Emitter Tests
//!
//! Runs layout, classification and method lowering over hand-built modules
//! and checks the emitted header and source text.

#include "codegen/c_emitter.hpp"
#include "codegen/c_types.hpp"
#include "lower/method_lowering.hpp"
#include "ownership/classifier.hpp"

#include <gtest/gtest.h>

using namespace a2c;
using namespace a2c::tree;
using types::make_bool;
using types::make_i32;
using types::make_i64;
using types::make_named;
using types::make_unit;

namespace {

auto has(const std::string& text, const std::string& needle) -> bool {
    return text.find(needle) != std::string::npos;
}

auto point_decl() -> TypeDecl {
    return make_record("Point", {make_field_decl("x", make_i32()), make_field_decl("y", make_i32())});
}

auto big_decl() -> TypeDecl {
    return make_record("Big", {make_field_decl("a", make_i64()), make_field_decl("b", make_i64()),
                               make_field_decl("c", make_i64())});
}

/// `Circle(r)`, `Rect(w, h)` and `Empty`.
auto shape_decl() -> TypeDecl {
    return make_tag("Shape",
                    {make_variant_decl("Circle", {make_field_decl("r", make_i32())}),
                     make_variant_decl("Rect", {make_field_decl("w", make_i32()),
                                                make_field_decl("h", make_i32())}),
                     make_variant_decl("Empty")});
}

auto var(const std::string& name, TypePtr type = make_i32()) -> ExprPtr {
    return make_var(name, std::move(type));
}

auto mul(ExprPtr left, ExprPtr right) -> ExprPtr {
    return make_binary(BinOp::Mul, std::move(left), std::move(right), make_i32());
}

auto unit_block(std::vector<StmtPtr> stmts) -> ExprPtr {
    return make_block(std::move(stmts), nullptr, make_unit());
}

} // namespace

class CEmitterTest : public ::testing::Test {
protected:
    LoweredModule module;
    layout::LayoutTable layouts;
    lower::SymbolTable symbols{"geo"};

    void SetUp() override {
        module.name = "geo";
    }

    /// Runs the passes that precede emission, then emits.
    auto emit(codegen::EmitOptions options = {})
        -> Result<codegen::EmittedArtifacts, diag::Diagnostic> {
        DeclIndex index(module);
        layout::LayoutCompiler compiler(index);
        auto table = compiler.run();
        if (is_err(table))
            return unwrap_err(table);
        layouts = std::move(unwrap(table));

        ownership::OwnershipClassifier classifier(module, index);
        auto classified = classifier.run();
        if (is_err(classified))
            return unwrap_err(classified);

        lower::MethodLowering lowering(module, layouts, symbols);
        auto lowered = lowering.run();
        if (is_err(lowered))
            return unwrap_err(lowered);

        return emit_again(std::move(options));
    }

    /// Emits the already lowered module once more.
    auto emit_again(codegen::EmitOptions options = {})
        -> Result<codegen::EmittedArtifacts, diag::Diagnostic> {
        DeclIndex index(module);
        codegen::CEmitter emitter(module, index, layouts, symbols, std::move(options));
        return emitter.emit();
    }

    void add_function(const std::string& name, std::vector<ParamDecl> params, TypePtr ret,
                      ExprPtr body) {
        module.functions.push_back(make_function(name, std::move(params), std::move(ret),
                                                 std::move(body)));
    }

    /// `type Point` with `modulus()` and `fn main() { let p = Point{3, 4}; let m = p.modulus(); }`
    void add_point_program() {
        auto point = point_decl();
        point.methods.push_back(make_method(
            "modulus", {}, make_i32(),
            make_block({},
                       make_binary(BinOp::Add,
                                   mul(make_self_field("x", make_i32()),
                                       make_self_field("x", make_i32())),
                                   mul(make_self_field("y", make_i32()),
                                       make_self_field("y", make_i32())),
                                   make_i32()),
                       make_i32())));
        module.types.push_back(std::move(point));

        add_function(
            "main", {}, make_unit(),
            unit_block(move_list<StmtPtr>(
                make_let("p", make_named("Point"),
                         make_struct(make_named("Point"),
                                     move_list<FieldInit>(FieldInit{"x", make_int_literal(3)},
                                                          FieldInit{"y", make_int_literal(4)}))),
                make_let("m", make_i32(),
                         make_method_call(var("p", make_named("Point")), make_named("Point"),
                                          "modulus", {}, make_i32())))));
    }
};

// ============================================================================
// Whole Artifacts
// ============================================================================

TEST_F(CEmitterTest, PointProgram) {
    add_point_program();

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& artifacts = unwrap(result);

    EXPECT_EQ(artifacts.header_name(), "geo.h");
    EXPECT_EQ(artifacts.source_name(), "geo.c");

    EXPECT_EQ(artifacts.header,
              "#ifndef A2C_GEO_H\n"
              "#define A2C_GEO_H\n"
              "\n"
              "// Generated by a2c from module 'geo'. Do not edit.\n"
              "\n"
              "#include <stdbool.h>\n"
              "#include <stddef.h>\n"
              "#include <stdint.h>\n"
              "\n"
              "struct Point {\n"
              "    int x;\n"
              "    int y;\n"
              "};\n"
              "\n"
              "int Point_modulus(const struct Point *self);\n"
              "int main(void);\n"
              "\n"
              "#endif // A2C_GEO_H\n");

    EXPECT_EQ(artifacts.source,
              "#include \"geo.h\"\n"
              "\n"
              "int Point_modulus(const struct Point *self) {\n"
              "    return self->x * self->x + self->y * self->y;\n"
              "}\n"
              "\n"
              "int main(void) {\n"
              "    struct Point p = {.x = 3, .y = 4};\n"
              "    int m = Point_modulus(&p);\n"
              "    return 0;\n"
              "}\n");

    EXPECT_EQ(symbols.find("Point_modulus")->decl_text,
              "int Point_modulus(const struct Point *self)");
    EXPECT_EQ(symbols.find("Point")->decl_text, "struct Point");
}

TEST_F(CEmitterTest, OutputIsDeterministic) {
    add_point_program();
    module.types.push_back(shape_decl());

    auto first = emit();
    auto second = emit_again();
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first).header, unwrap(second).header);
    EXPECT_EQ(unwrap(first).source, unwrap(second).source);
}

TEST_F(CEmitterTest, OptionsShapeTheText) {
    add_point_program();

    codegen::EmitOptions options;
    options.emit_comments = false;
    options.indent_width = 2;
    options.guard_prefix = "mylib";

    auto result = emit(options);
    ASSERT_TRUE(is_ok(result));
    const auto& artifacts = unwrap(result);
    EXPECT_TRUE(has(artifacts.header, "#ifndef MYLIB_GEO_H\n"));
    EXPECT_FALSE(has(artifacts.header, "// Generated"));
    EXPECT_TRUE(has(artifacts.header, "struct Point {\n  int x;\n"));
    EXPECT_TRUE(has(artifacts.source, "\n  struct Point p = {.x = 3, .y = 4};\n"));
}

// ============================================================================
// Types
// ============================================================================

TEST_F(CEmitterTest, TagBecomesEnumAndUnion) {
    module.types.push_back(shape_decl());

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).header,
                    "enum ShapeKind {\n"
                    "    SHAPE_CIRCLE = 0,\n"
                    "    SHAPE_RECT = 1,\n"
                    "    SHAPE_EMPTY = 2,\n"
                    "};\n"
                    "\n"
                    "struct Shape {\n"
                    "    enum ShapeKind tag;\n"
                    "    union {\n"
                    "        int Circle;\n"
                    "        struct {\n"
                    "            int w;\n"
                    "            int h;\n"
                    "        } Rect;\n"
                    "    } as;\n"
                    "};\n"));
    EXPECT_EQ(symbols.find("SHAPE_RECT")->decl_text, "SHAPE_RECT = 1");
}

TEST_F(CEmitterTest, StoredTypesComeFirstAndPointeesAreForwardDeclared) {
    module.types.push_back(make_record("Line", {make_field_decl("a", make_named("Point")),
                                                make_field_decl("b", make_named("Point"))}));
    module.types.push_back(point_decl());
    module.types.push_back(make_record(
        "Node", {make_field_decl("value", make_i32()),
                 make_field_decl("next", types::make_indirect(make_named("Node")))}));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& header = unwrap(result).header;
    EXPECT_LT(header.find("struct Point {"), header.find("struct Line {"));
    EXPECT_TRUE(has(header, "\nstruct Node;\n"));
    EXPECT_TRUE(has(header, "    struct Node *next;\n"));
}

// ============================================================================
// Functions
// ============================================================================

TEST_F(CEmitterTest, ReferenceParametersUsePointers) {
    module.types.push_back(big_decl());
    add_function("show", {make_param("b", make_named("Big"))}, make_unit(), unit_block({}));
    add_function("grow", {make_param("b", make_named("Big"), ParamIntent::Mutate)}, make_unit(),
                 unit_block(move_list<StmtPtr>(make_expr_stmt(make_assign(
                     make_field(var("b", make_named("Big")), "a", make_i64()),
                     make_int_literal(5, make_i64()))))));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& artifacts = unwrap(result);
    EXPECT_TRUE(has(artifacts.header, "void show(const struct Big *b);\n"));
    EXPECT_TRUE(has(artifacts.header, "void grow(struct Big *b);\n"));
    EXPECT_TRUE(has(artifacts.source, "    b->a = 5;\n"));
}

TEST_F(CEmitterTest, RvalueForReferenceSlotIsMaterialized) {
    module.types.push_back(big_decl());
    add_function("show", {make_param("b", make_named("Big"))}, make_unit(), unit_block({}));
    add_function(
        "main", {}, make_unit(),
        unit_block(move_list<StmtPtr>(make_expr_stmt(make_call(
            "show",
            move_list<ExprPtr>(make_struct(
                make_named("Big"),
                move_list<FieldInit>(FieldInit{"a", make_int_literal(1, make_i64())},
                                     FieldInit{"b", make_int_literal(2, make_i64())},
                                     FieldInit{"c", make_int_literal(3, make_i64())}))),
            make_unit())))));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source,
                    "    struct Big _t0 = {.a = 1, .b = 2, .c = 3};\n"
                    "    show(&_t0);\n"));
}

TEST_F(CEmitterTest, ArrayParametersPointToTheCallersArray) {
    auto quad = types::make_array(make_i32(), 4);
    add_function("poke", {make_param("a", quad, ParamIntent::Mutate)}, make_unit(),
                 unit_block(move_list<StmtPtr>(make_expr_stmt(
                     make_assign(make_index(var("a", quad), make_int_literal(0), make_i32()),
                                 make_int_literal(99))))));
    add_function("first", {make_param("a", quad)}, make_i32(),
                 make_block({}, make_index(var("a", quad), make_int_literal(0), make_i32()),
                            make_i32()));
    add_function("main", {}, make_unit(),
                 unit_block(move_list<StmtPtr>(
                     make_let("xs", quad, nullptr, true),
                     make_expr_stmt(make_call("poke", move_list<ExprPtr>(var("xs", quad)),
                                              make_unit())))));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& artifacts = unwrap(result);
    EXPECT_TRUE(has(artifacts.header, "void poke(int (*a)[4]);\n"));
    EXPECT_TRUE(has(artifacts.header, "int first(int (*a)[4]);\n"));
    EXPECT_TRUE(has(artifacts.source, "    (*a)[0] = 99;\n"));
    EXPECT_TRUE(has(artifacts.source, "    return (*a)[0];\n"));
    EXPECT_TRUE(has(artifacts.source, "    int xs[4];\n    poke(&xs);\n"));
}

TEST_F(CEmitterTest, ExternalFunctionsAreOnlyDeclared) {
    add_function("print_int", {make_param("n", make_i32())}, make_unit(), nullptr);

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& artifacts = unwrap(result);
    EXPECT_TRUE(has(artifacts.header, "// Provided externally\nvoid print_int(int n);\n"));
    EXPECT_FALSE(has(artifacts.source, "print_int"));
}

// ============================================================================
// Control Flow
// ============================================================================

TEST_F(CEmitterTest, MatchOverTagBecomesSwitch) {
    module.types.push_back(shape_decl());
    std::vector<MatchArm> arms;
    arms.push_back(make_arm(make_variant_pattern("Circle", {"r"}), mul(var("r"), var("r"))));
    arms.push_back(make_arm(make_variant_pattern("Rect", {"w", "h"}), mul(var("w"), var("h"))));
    arms.push_back(make_arm(make_variant_pattern("Empty"), make_int_literal(0)));
    add_function("area", {make_param("s", make_named("Shape"))}, make_i32(),
                 make_block({}, make_match(var("s", make_named("Shape")), std::move(arms), make_i32()),
                            make_i32()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source,
                    "int area(struct Shape s) {\n"
                    "    switch (s.tag) {\n"
                    "    case SHAPE_CIRCLE: {\n"
                    "        int r = s.as.Circle;\n"
                    "        return r * r;\n"
                    "    } break;\n"
                    "    case SHAPE_RECT: {\n"
                    "        int w = s.as.Rect.w;\n"
                    "        int h = s.as.Rect.h;\n"
                    "        return w * h;\n"
                    "    } break;\n"
                    "    case SHAPE_EMPTY: {\n"
                    "        return 0;\n"
                    "    } break;\n"
                    "    }\n"
                    "}\n"));
}

TEST_F(CEmitterTest, VariantConstructionUsesDesignators) {
    module.types.push_back(shape_decl());
    add_function("make", {}, make_unit(),
                 unit_block(move_list<StmtPtr>(make_let(
                     "s", make_named("Shape"),
                     make_variant(make_named("Shape"), "Rect",
                                  move_list<ExprPtr>(make_int_literal(3), make_int_literal(4)))))));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source,
                    "    struct Shape s = {.tag = SHAPE_RECT, .as.Rect.w = 3, .as.Rect.h = 4};\n"));
}

TEST_F(CEmitterTest, ScalarMatchWithCatchAll) {
    std::vector<MatchArm> arms;
    arms.push_back(make_arm(make_literal_pattern(0), make_int_literal(1)));
    arms.push_back(make_arm(make_binding_pattern("other"), var("other")));
    add_function("f", {make_param("n", make_i32())}, make_i32(),
                 make_block({}, make_match(var("n"), std::move(arms), make_i32()), make_i32()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& source = unwrap(result).source;
    EXPECT_TRUE(has(source, "    switch (n) {\n    case 0: {\n        return 1;\n"));
    EXPECT_TRUE(has(source, "    default: {\n        int other = n;\n        return other;\n"));
}

TEST_F(CEmitterTest, ValuedIfIsAssignedInEveryBranch) {
    add_function("pick", {make_param("c", make_bool())}, make_i32(),
                 make_block(move_list<StmtPtr>(make_let(
                                "v", make_i32(),
                                make_if(var("c", make_bool()), make_int_literal(1),
                                        make_int_literal(2), make_i32()))),
                            var("v"), make_i32()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source,
                    "    int v;\n"
                    "    if (c) {\n"
                    "        v = 1;\n"
                    "    } else {\n"
                    "        v = 2;\n"
                    "    }\n"
                    "    return v;\n"));
}

TEST_F(CEmitterTest, ValuedIfAsArgumentGoesThroughTemporary) {
    add_function("id", {make_param("n", make_i32())}, make_i32(),
                 make_block({}, var("n"), make_i32()));
    add_function("pick", {make_param("c", make_bool())}, make_i32(),
                 make_block({},
                            make_call("id",
                                      move_list<ExprPtr>(make_if(var("c", make_bool()),
                                                                 make_int_literal(1),
                                                                 make_int_literal(2), make_i32())),
                                      make_i32()),
                            make_i32()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& source = unwrap(result).source;
    EXPECT_TRUE(has(source, "    int _t0;\n    if (c) {\n        _t0 = 1;\n"));
    EXPECT_TRUE(has(source, "    return id(_t0);\n"));
}

TEST_F(CEmitterTest, RangeLoop) {
    add_function("count", {make_param("n", make_i32())}, make_unit(),
                 unit_block(move_list<StmtPtr>(make_expr_stmt(
                     make_for("i", make_int_literal(0), var("n"), unit_block({}))))));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source, "    for (int i = 0; i < n; i++) {\n"));
}

TEST_F(CEmitterTest, ArrayPayloadIsBoundThroughPointer) {
    auto triple = types::make_array(make_i32(), 3);
    module.types.push_back(make_tag(
        "Buffer", {make_variant_decl("Data", {make_field_decl("values", triple)}),
                   make_variant_decl("Empty")}));
    std::vector<MatchArm> arms;
    arms.push_back(make_arm(make_variant_pattern("Data", {"v"}),
                            make_index(var("v", triple), make_int_literal(0), make_i32())));
    arms.push_back(make_arm(make_variant_pattern("Empty"), make_int_literal(0)));
    add_function("head", {make_param("b", make_named("Buffer"))}, make_i32(),
                 make_block({}, make_match(var("b", make_named("Buffer")), std::move(arms),
                                           make_i32()),
                            make_i32()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source,
                    "    case BUFFER_DATA: {\n"
                    "        int (*v)[3] = &b.as.Data;\n"
                    "        return (*v)[0];\n"
                    "    } break;\n"));
}

// ============================================================================
// Short-Circuit Operators
// ============================================================================

namespace {

/// `x <cmp> 0 <op> { 10 / x > 1 }`
auto guarded_division(BinOp cmp, BinOp op) -> ExprPtr {
    auto quotient = make_binary(BinOp::Div, make_int_literal(10), var("x"), make_i32());
    auto right = make_block(
        {}, make_binary(BinOp::Gt, std::move(quotient), make_int_literal(1), make_bool()),
        make_bool());
    return make_binary(op, make_binary(cmp, var("x"), make_int_literal(0), make_bool()),
                       std::move(right), make_bool());
}

} // namespace

TEST_F(CEmitterTest, AndRunsRightStatementsOnlyWhenLeftHolds) {
    add_function("safe", {make_param("x", make_i32())}, make_bool(),
                 make_block({}, guarded_division(BinOp::Ne, BinOp::And), make_bool()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source,
                    "bool safe(int x) {\n"
                    "    bool _t0 = x != 0;\n"
                    "    if (_t0) {\n"
                    "        {\n"
                    "            _t0 = 10 / x > 1;\n"
                    "        }\n"
                    "    }\n"
                    "    return _t0;\n"
                    "}\n"));
}

TEST_F(CEmitterTest, OrRunsRightStatementsOnlyWhenLeftFails) {
    add_function("either", {make_param("x", make_i32())}, make_bool(),
                 make_block({}, guarded_division(BinOp::Eq, BinOp::Or), make_bool()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    const auto& source = unwrap(result).source;
    EXPECT_TRUE(has(source, "    bool _t0 = x == 0;\n    if (!_t0) {\n"));
    EXPECT_TRUE(has(source, "            _t0 = 10 / x > 1;\n"));
    EXPECT_TRUE(has(source, "    return _t0;\n"));
}

TEST_F(CEmitterTest, PlainOperandsKeepTheOperator) {
    add_function("both", {make_param("a", make_bool()), make_param("b", make_bool())},
                 make_bool(),
                 make_block({},
                            make_binary(BinOp::And, var("a", make_bool()), var("b", make_bool()),
                                        make_bool()),
                            make_bool()));

    auto result = emit();
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(has(unwrap(result).source, "    return a && b;\n"));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(CEmitterTest, MethodCallReachingEmissionIsInternal) {
    module.types.push_back(point_decl());
    add_function("main", {make_param("p", make_named("Point"))}, make_i32(),
                 make_block({},
                            make_method_call(var("p", make_named("Point")), make_named("Point"),
                                             "norm", {}, make_i32()),
                            make_i32()));

    auto result = emit_again();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::Internal);
    EXPECT_EQ(unwrap_err(result).symbol, "main");
}

TEST(CTypesTest, Declarators) {
    EXPECT_EQ(codegen::c_declare(make_i32(), "x"), "int x");
    EXPECT_EQ(codegen::c_declare(types::make_array(make_i32(), 4), "xs"), "int xs[4]");
    EXPECT_EQ(codegen::c_declare(types::make_ptr(make_named("P")), "p"), "struct P *p");
    EXPECT_EQ(codegen::c_declare(types::make_str(), "s"), "char *s");
    EXPECT_EQ(codegen::c_macro_name("a2c_my-mod_H"), "A2C_MY_MOD_H");
}
