//! # C Emitter
//!
//! Serializes a lowered module into its two artifacts.
//!
//! ## Declarations (`<module>.h`)
//!
//! 1. Include guard `<PREFIX>_<MODULE>_H`
//! 2. `stdbool.h`, `stddef.h`, `stdint.h`, then one include per import
//! 3. Forward declarations of records reached through pointers
//! 4. Types, each after the types it stores by value (declaration order
//!    otherwise); instances wrapped in `#ifndef A2C_INST_<name>`
//! 5. Prototypes of functions with bodies, then of external functions
//!
//! ## Definitions (`<module>.c`)
//!
//! `#include "<module>.h"`, prototypes of the module's generic function
//! instances (emitted `static`), then every function body.
//!
//! ## Expression Lowering
//!
//! | Construct                      | C                                      |
//! |--------------------------------|----------------------------------------|
//! | `if`/`match`/block with value  | `T _tN;` assigned in every branch      |
//! | `match` over a tag             | `switch (x.tag)` with payload locals   |
//! | `match` over a scalar          | `switch (x)`                           |
//! | `a && {..}` (likewise `or`)    | `bool _tN = a; if (_tN) {..}`          |
//! | `for i in a..b`                | `for (int i = a; i < b; i++)`          |
//! | `loop` / `while c`             | `while (1)` / `while (c)`              |
//! | reference parameter `p`        | `p->f` for fields, `(*p)` for values   |
//! | argument to a reference slot   | `&arg`, or a temporary for rvalues     |
//!
//! Output depends only on the module, so the same input always produces
//! byte-identical artifacts.

#pragma once

#include "diag/diagnostic.hpp"
#include "layout/layout_compiler.hpp"
#include "lower/symbol_table.hpp"
#include "tree/tree.hpp"

#include <map>
#include <sstream>

namespace a2c::codegen {

struct EmitOptions {
    bool emit_comments = true;        ///< Banner and instance origin comments
    int indent_width = 4;             ///< Spaces per nesting level
    std::string guard_prefix = "A2C"; ///< Prefix of the header include guard
    bool instance_guards = true;      ///< `#ifndef A2C_INST_<name>` around instance types
};

struct EmittedArtifacts {
    std::string module;
    std::string header; ///< Contents of `<module>.h`
    std::string source; ///< Contents of `<module>.c`

    [[nodiscard]] auto header_name() const -> std::string {
        return module + ".h";
    }

    [[nodiscard]] auto source_name() const -> std::string {
        return module + ".c";
    }
};

class CEmitter {
public:
    CEmitter(const tree::LoweredModule& module, const tree::DeclIndex& index,
             const layout::LayoutTable& layouts, lower::SymbolTable& symbols,
             EmitOptions options = {});

    [[nodiscard]] auto emit() -> Result<EmittedArtifacts, diag::Diagnostic>;

private:
    /// Where the value of an expression lowered as statements goes.
    struct Sink {
        enum class Kind { Discard, Return, Assign };
        Kind kind = Kind::Discard;
        std::string target;

        static auto discard() -> Sink {
            return Sink{};
        }
        static auto to_return() -> Sink {
            return Sink{Kind::Return, ""};
        }
        static auto assign(std::string target) -> Sink {
            return Sink{Kind::Assign, std::move(target)};
        }
    };

    const tree::LoweredModule& module_;
    const tree::DeclIndex& index_;
    const layout::LayoutTable& layouts_;
    lower::SymbolTable& symbols_;
    EmitOptions options_;

    std::ostringstream out_;
    int indent_level_ = 0;
    int temp_counter_ = 0;
    const tree::FuncDecl* current_func_ = nullptr;
    std::vector<std::map<std::string, bool>> pointer_scopes_;
    std::optional<diag::Diagnostic> error_;

    // Output helpers
    void emit_line(const std::string& code);
    void push_indent();
    void pop_indent();
    [[nodiscard]] auto indent() const -> std::string;
    void fail(diag::ErrorKind kind, const std::string& symbol, std::string message,
              const SourceSpan& span);

    // Module level (c_emitter.cpp)
    [[nodiscard]] auto gen_header() -> std::string;
    [[nodiscard]] auto gen_source() -> std::string;
    [[nodiscard]] auto gen_forward_decls() -> std::string;
    [[nodiscard]] auto type_order() const -> std::vector<const tree::TypeDecl*>;
    [[nodiscard]] auto gen_type_decl(const tree::TypeDecl& decl) -> std::string;
    [[nodiscard]] auto gen_record(const tree::TypeDecl& decl) -> std::string;
    [[nodiscard]] auto gen_tag(const tree::TypeDecl& decl, const layout::TagLayout& tag)
        -> std::string;
    [[nodiscard]] auto gen_prototype(const tree::FuncDecl& func) -> std::string;
    [[nodiscard]] auto gen_param(const tree::ParamDecl& param) -> std::string;
    [[nodiscard]] auto gen_function(const tree::FuncDecl& func) -> std::string;
    [[nodiscard]] auto guard_name() const -> std::string;
    [[nodiscard]] auto is_main(const tree::FuncDecl& func) const -> bool;

    // Statements (c_emit_stmt.cpp)
    void gen_block_body(const tree::BlockExpr& block, const Sink& sink);
    void gen_stmt(const tree::Stmt& stmt);
    void gen_let(const tree::LetStmt& let);
    void gen_value(const tree::Expr& expr, const Sink& sink);
    void gen_if(const tree::IfExpr& expr, const Sink& sink);
    void gen_match(const tree::MatchExpr& expr, const Sink& sink);
    void gen_loop(const tree::LoopExpr& loop);
    void gen_for(const tree::ForExpr& loop);
    void gen_return(const tree::ReturnExpr& ret);
    void deliver(const std::string& value, const types::TypePtr& type, const Sink& sink);
    void gen_branch(const tree::Expr& body, const Sink& sink);

    // Expressions (c_emit_expr.cpp)
    [[nodiscard]] auto gen_expr(const tree::Expr& expr) -> std::string;
    [[nodiscard]] auto gen_literal(const tree::LiteralExpr& lit) -> std::string;
    [[nodiscard]] auto gen_var(const tree::VarExpr& var) -> std::string;
    [[nodiscard]] auto gen_field(const tree::FieldExpr& field) -> std::string;
    [[nodiscard]] auto gen_index(const tree::IndexExpr& index) -> std::string;
    [[nodiscard]] auto gen_binary(const tree::BinaryExpr& bin) -> std::string;
    [[nodiscard]] auto gen_short_circuit(const tree::BinaryExpr& bin) -> std::string;
    [[nodiscard]] auto gen_unary(const tree::UnaryExpr& unary) -> std::string;
    [[nodiscard]] auto gen_call(const tree::CallExpr& call) -> std::string;
    [[nodiscard]] auto gen_assign(const tree::AssignExpr& assign) -> std::string;
    [[nodiscard]] auto gen_struct_init(const tree::StructExpr& init) -> std::string;
    [[nodiscard]] auto gen_variant_init(const tree::VariantExpr& init) -> std::string;

    /// Initializer of a declaration: braces for aggregates, else `gen_expr`.
    [[nodiscard]] auto gen_init(const tree::Expr& expr) -> std::string;

    /// Lowers a value-producing control-flow expression through a temporary.
    [[nodiscard]] auto gen_hoisted(const tree::Expr& expr) -> std::string;

    /// Argument for a reference or pointer slot.
    [[nodiscard]] auto gen_ref_arg(const tree::Expr& arg) -> std::string;

    /// Object of a field access, and whether it is reached through a pointer.
    [[nodiscard]] auto gen_object(const tree::Expr& object) -> std::pair<std::string, bool>;

    [[nodiscard]] auto new_temp() -> std::string;

    /// Whether lowering `expr` emits statements before the expression text.
    [[nodiscard]] auto hoists(const tree::Expr& expr) const -> bool;

    // Locals that hold a pointer to their value (reference parameters)
    void push_scope();
    void pop_scope();
    void declare_local(const std::string& name, bool is_pointer);
    [[nodiscard]] auto is_pointer_var(const std::string& name) const -> bool;
};

/// Whether the expression is lowered to statements rather than to a C
/// expression.
[[nodiscard]] auto needs_statements(const tree::Expr& expr) -> bool;

/// Variables and field or element accesses rooted at one.
[[nodiscard]] auto is_place(const tree::Expr& expr) -> bool;

} // namespace a2c::codegen
