#include "driver/compilation_run.hpp"

#include "log/log.hpp"
#include "lower/method_lowering.hpp"
#include "mono/monomorphizer.hpp"

#include <algorithm>

namespace a2c::driver {

auto describe_cycle(const std::vector<std::string>& cycle) -> std::string {
    std::string text;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0)
            text += " -> ";
        text += cycle[i];
    }
    return text;
}

auto CompilationRun::compile_unit(tree::ModuleUnit unit,
                                  const std::vector<tree::ImportedModule>& imports)
    -> Result<Rc<ModuleOutput>, diag::Diagnostic> {
    auto output = make_rc<ModuleOutput>();
    output->unit = std::move(unit);
    const auto& name = output->unit.name;
    A2C_LOG_INFO("driver", "Compiling module " << name);

    auto failed = [&](diag::Diagnostic diagnostic) {
        A2C_LOG_DEBUG("driver", "Module " << name << " failed: " << diag::summarize(diagnostic));
        return diagnostic;
    };

    // Resolve and monomorphize
    std::vector<const tree::ModuleUnit*> import_units;
    for (const auto& imported : imports) {
        if (imported.unit)
            import_units.push_back(imported.unit);
    }
    mono::Monomorphizer mono(output->unit, registry_, std::move(import_units));
    auto lowered = mono.run();
    if (is_err(lowered)) {
        return failed(unwrap_err(lowered));
    }
    output->lowered = std::move(unwrap(lowered));
    output->instantiations = mono.instantiations();

    tree::DeclIndex index(output->lowered);
    for (const auto& imported : imports) {
        if (imported.lowered)
            index.add_import(*imported.lowered);
    }

    // Layout and exhaustiveness
    layout::LayoutCompiler layouts(index);
    auto layout_table = layouts.run();
    if (is_err(layout_table)) {
        return failed(unwrap_err(layout_table));
    }
    output->layouts = std::move(unwrap(layout_table));

    // Passing modes and binding mutability
    ownership::OwnershipClassifier classifier(output->lowered, index, options_.ownership);
    auto classified = classifier.run();
    if (is_err(classified)) {
        return failed(unwrap_err(classified));
    }

    // Methods become free functions
    output->symbols = lower::SymbolTable(name);
    lower::MethodLowering lowering(output->lowered, output->layouts, output->symbols);
    auto lowered_methods = lowering.run();
    if (is_err(lowered_methods)) {
        return failed(unwrap_err(lowered_methods));
    }

    codegen::CEmitter emitter(output->lowered, index, output->layouts, output->symbols,
                              options_.emit);
    auto artifacts = emitter.emit();
    if (is_err(artifacts)) {
        return failed(unwrap_err(artifacts));
    }
    output->artifacts = std::move(unwrap(artifacts));

    A2C_LOG_INFO("driver", "Compiled " << name << " (" << output->instantiations.size()
                                       << " instantiations, " << output->symbols.size()
                                       << " symbols)");
    return output;
}

auto CompilationRun::compile(const assemble::FragmentProvider& provider,
                             const std::string& module) -> Result<BuildOutputs, diag::Diagnostic> {
    BuildOutputs outputs;
    std::vector<std::string> stack;
    auto result = compile_recursive(provider, module, stack, outputs);
    if (is_err(result)) {
        return unwrap_err(result);
    }
    return outputs;
}

auto CompilationRun::compile_recursive(const assemble::FragmentProvider& provider,
                                       const std::string& module, std::vector<std::string>& stack,
                                       BuildOutputs& outputs) -> Result<Unit, diag::Diagnostic> {
    if (outputs.count(module) > 0) {
        return Unit{};
    }
    auto on_stack = std::find(stack.begin(), stack.end(), module);
    if (on_stack != stack.end()) {
        std::vector<std::string> cycle(on_stack, stack.end());
        cycle.push_back(module);
        return diag::make_diagnostic(diag::ErrorKind::MalformedTree, module, "",
                                     "import cycle: " + describe_cycle(cycle));
    }

    assemble::Assembler assembler(provider);
    auto assembled = assembler.assemble(module, options_.scenario);
    if (is_err(assembled)) {
        return unwrap_err(assembled);
    }
    auto unit = std::move(unwrap(assembled));

    stack.push_back(module);
    std::vector<tree::ImportedModule> imports;
    for (const auto& imported : unit.imports) {
        auto built = compile_recursive(provider, imported, stack, outputs);
        if (is_err(built)) {
            return unwrap_err(built);
        }
        imports.push_back(outputs.at(imported)->as_import());
    }
    stack.pop_back();

    auto compiled = compile_unit(std::move(unit), imports);
    if (is_err(compiled)) {
        return unwrap_err(compiled);
    }
    outputs.emplace(module, std::move(unwrap(compiled)));
    return Unit{};
}

} // namespace a2c::driver
