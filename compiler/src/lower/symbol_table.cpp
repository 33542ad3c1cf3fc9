#include "lower/symbol_table.hpp"

#include "log/log.hpp"

namespace a2c::lower {

auto symbol_kind_name(SymbolKind kind) -> const char* {
    switch (kind) {
    case SymbolKind::Type:
        return "type";
    case SymbolKind::TagEnum:
        return "enum";
    case SymbolKind::EnumConstant:
        return "enum constant";
    case SymbolKind::Function:
        return "function";
    case SymbolKind::ExternFunction:
        return "extern function";
    }
    return "?";
}

auto SymbolTable::add(EmittedSymbol symbol, const SourceSpan& span)
    -> Result<Unit, diag::Diagnostic> {
    auto it = symbols_.find(symbol.name);
    if (it != symbols_.end()) {
        const auto& existing = it->second;
        return diag::make_diagnostic(diag::ErrorKind::SymbolCollision, module_, symbol.name,
                                     std::string(symbol_kind_name(symbol.kind)) + " '" +
                                         symbol.name + "' from '" + symbol.owner +
                                         "' collides with " + symbol_kind_name(existing.kind) +
                                         " from '" + existing.owner + "'",
                                     span);
    }
    A2C_LOG_TRACE("lower", "Symbol " << symbol.name << " (" << symbol_kind_name(symbol.kind)
                                     << ")");
    auto name = symbol.name;
    symbols_.emplace(std::move(name), std::move(symbol));
    return Unit{};
}

auto SymbolTable::find(const std::string& name) const -> const EmittedSymbol* {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
}

void SymbolTable::set_decl_text(const std::string& name, std::string text) {
    auto it = symbols_.find(name);
    if (it != symbols_.end()) {
        it->second.decl_text = std::move(text);
    }
}

} // namespace a2c::lower
