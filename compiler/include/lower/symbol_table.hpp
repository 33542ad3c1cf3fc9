//! # Emitted Symbol Table
//!
//! Every top-level C entity of a module (struct, discriminant enum, enum
//! constant, function) is registered here under its final name before it
//! is emitted. A name can be registered once; a second registration is a
//! `SymbolCollision`.
//!
//! Method lowering registers the names; the emitter fills in the
//! declaration text of each symbol as it writes it.

#pragma once

#include "diag/diagnostic.hpp"

#include <map>

namespace a2c::lower {

enum class SymbolKind {
    Type,           ///< `struct Name`
    TagEnum,        ///< `enum NameKind`
    EnumConstant,   ///< `NAME_VARIANT`
    Function,       ///< Function with a body
    ExternFunction, ///< Prototype only
};

[[nodiscard]] auto symbol_kind_name(SymbolKind kind) -> const char*;

struct EmittedSymbol {
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string owner;     ///< Declaration the symbol comes from, for messages
    std::string decl_text; ///< Filled by the emitter
};

class SymbolTable {
public:
    explicit SymbolTable(std::string module) : module_(std::move(module)) {}

    [[nodiscard]] auto add(EmittedSymbol symbol, const SourceSpan& span = {})
        -> Result<Unit, diag::Diagnostic>;

    [[nodiscard]] auto find(const std::string& name) const -> const EmittedSymbol*;

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return symbols_.count(name) > 0;
    }

    /// Records the declaration text of an already registered symbol.
    void set_decl_text(const std::string& name, std::string text);

    [[nodiscard]] auto symbols() const -> const std::map<std::string, EmittedSymbol>& {
        return symbols_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return symbols_.size();
    }

    [[nodiscard]] auto module() const -> const std::string& {
        return module_;
    }

private:
    std::string module_;
    std::map<std::string, EmittedSymbol> symbols_;
};

} // namespace a2c::lower
