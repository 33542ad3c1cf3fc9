#include "diag/diagnostic.hpp"

#include <sstream>

namespace a2c::diag {

auto error_code(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::AssemblyConflict:
        return "A001";
    case ErrorKind::ModuleNotFound:
        return "A002";
    case ErrorKind::UnresolvedGeneric:
        return "G001";
    case ErrorKind::CyclicInstantiation:
        return "G002";
    case ErrorKind::NonExhaustiveMatch:
        return "D001";
    case ErrorKind::InvalidLayout:
        return "D002";
    case ErrorKind::OwnershipViolation:
        return "O001";
    case ErrorKind::SymbolCollision:
        return "S001";
    case ErrorKind::MalformedTree:
        return "T001";
    case ErrorKind::OutputError:
        return "W001";
    case ErrorKind::Internal:
        return "X001";
    }
    return "X001";
}

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::AssemblyConflict:
        return "AssemblyConflict";
    case ErrorKind::ModuleNotFound:
        return "ModuleNotFound";
    case ErrorKind::UnresolvedGeneric:
        return "UnresolvedGeneric";
    case ErrorKind::CyclicInstantiation:
        return "CyclicInstantiation";
    case ErrorKind::NonExhaustiveMatch:
        return "NonExhaustiveMatch";
    case ErrorKind::InvalidLayout:
        return "InvalidLayout";
    case ErrorKind::OwnershipViolation:
        return "OwnershipViolation";
    case ErrorKind::SymbolCollision:
        return "SymbolCollision";
    case ErrorKind::MalformedTree:
        return "MalformedTree";
    case ErrorKind::OutputError:
        return "OutputError";
    case ErrorKind::Internal:
        return "Internal";
    }
    return "Internal";
}

auto make_diagnostic(ErrorKind kind, std::string module, std::string symbol, std::string message,
                     const SourceSpan& span) -> Diagnostic {
    Diagnostic diag;
    diag.kind = kind;
    diag.module = std::move(module);
    diag.symbol = std::move(symbol);
    diag.message = std::move(message);
    if (span.is_known()) {
        diag.span = span;
    }
    return diag;
}

auto summarize(const Diagnostic& diag) -> std::string {
    std::ostringstream oss;
    oss << diag.code() << " [" << diag.module << "]";
    if (!diag.symbol.empty()) {
        oss << " " << diag.symbol << ":";
    }
    oss << " " << diag.message;
    if (diag.span) {
        oss << " (" << span_to_string(*diag.span) << ")";
    }
    return oss.str();
}

} // namespace a2c::diag
