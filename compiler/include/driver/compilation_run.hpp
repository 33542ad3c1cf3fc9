//! # Compilation Run
//!
//! Runs the backend pipeline over one module:
//!
//! ```text
//! ModuleUnit → Monomorphizer → LayoutCompiler → OwnershipClassifier
//!            → MethodLowering → CEmitter → EmittedArtifacts
//! ```
//!
//! A `CompilationRun` owns the context shared by every module of a build:
//! the options and the `InstantiationRegistry`. Per-module tables (the
//! instantiation table, layouts, symbols) live in the `ModuleOutput`.
//! Several modules may be compiled through the same run concurrently.

#pragma once

#include "assemble/assembler.hpp"
#include "codegen/c_emitter.hpp"
#include "layout/layout_compiler.hpp"
#include "lower/symbol_table.hpp"
#include "mono/instantiation.hpp"
#include "ownership/classifier.hpp"

#include <map>

namespace a2c::driver {

struct CompileOptions {
    tree::Scenario scenario = tree::Scenario::TransC;
    codegen::EmitOptions emit;
    ownership::OwnershipOptions ownership;
};

/// Everything produced for one module. Importers read `unit` (generic
/// declarations) and `lowered` (concrete types and signatures).
struct ModuleOutput {
    tree::ModuleUnit unit;
    tree::LoweredModule lowered;
    std::vector<mono::GenericInstantiation> instantiations;
    layout::LayoutTable layouts;
    lower::SymbolTable symbols{""};
    codegen::EmittedArtifacts artifacts;

    [[nodiscard]] auto as_import() const -> tree::ImportedModule {
        return tree::ImportedModule{&unit, &lowered};
    }
};

/// Outputs of a build by module name.
using BuildOutputs = std::map<std::string, Rc<ModuleOutput>>;

class CompilationRun {
public:
    explicit CompilationRun(CompileOptions options = {}) : options_(std::move(options)) {}

    /// Compiles an assembled module whose imports are already compiled.
    [[nodiscard]] auto compile_unit(tree::ModuleUnit unit,
                                    const std::vector<tree::ImportedModule>& imports = {})
        -> Result<Rc<ModuleOutput>, diag::Diagnostic>;

    /// Assembles and compiles `module` and, before it, every module it
    /// transitively imports. Single threaded.
    [[nodiscard]] auto compile(const assemble::FragmentProvider& provider,
                               const std::string& module) -> Result<BuildOutputs, diag::Diagnostic>;

    [[nodiscard]] auto options() const -> const CompileOptions& {
        return options_;
    }

    [[nodiscard]] auto registry() -> mono::InstantiationRegistry& {
        return registry_;
    }

private:
    CompileOptions options_;
    mono::InstantiationRegistry registry_;

    [[nodiscard]] auto compile_recursive(const assemble::FragmentProvider& provider,
                                         const std::string& module,
                                         std::vector<std::string>& stack, BuildOutputs& outputs)
        -> Result<Unit, diag::Diagnostic>;
};

/// Message for an import cycle: `a -> b -> a`.
[[nodiscard]] auto describe_cycle(const std::vector<std::string>& cycle) -> std::string;

} // namespace a2c::driver
