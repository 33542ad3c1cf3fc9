//! # Backend Diagnostics
//!
//! Every error raised by any pass is a `Diagnostic` value. The backend never
//! prints diagnostics itself; they are returned to the caller, which hands
//! them to an external renderer.
//!
//! ## Error Codes
//!
//! | Code | Kind                  | Raised by              |
//! |------|-----------------------|------------------------|
//! | A001 | `AssemblyConflict`    | Fragment assembler     |
//! | A002 | `ModuleNotFound`      | Fragment assembler     |
//! | G001 | `UnresolvedGeneric`   | Monomorphizer          |
//! | G002 | `CyclicInstantiation` | Monomorphizer          |
//! | D001 | `NonExhaustiveMatch`  | Layout compiler        |
//! | D002 | `InvalidLayout`       | Layout compiler        |
//! | O001 | `OwnershipViolation`  | Ownership classifier   |
//! | S001 | `SymbolCollision`     | Monomorphizer, lowering, emitter |
//! | T001 | `MalformedTree`       | Any pass (input contract violation) |
//! | W001 | `OutputError`         | Artifact writer        |
//! | X001 | `Internal`            | Any pass (broken invariant) |

#ifndef A2C_DIAG_DIAGNOSTIC_HPP
#define A2C_DIAG_DIAGNOSTIC_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace a2c::diag {

/// Category of a backend error.
enum class ErrorKind {
    AssemblyConflict,    ///< Duplicate definition across or within fragments
    ModuleNotFound,      ///< Neither the shared nor the scenario fragment exists
    UnresolvedGeneric,   ///< Unbound or partially applied generic parameter
    CyclicInstantiation, ///< Generic instantiated in terms of itself
    NonExhaustiveMatch,  ///< Match misses variants and has no catch-all
    InvalidLayout,       ///< Duplicate discriminant, record containing itself by value
    OwnershipViolation,  ///< Mutable access on an immutable-origin binding
    SymbolCollision,     ///< Two emitted symbols share a mangled name
    MalformedTree,       ///< The Program Tree violates its input contract
    OutputError,         ///< Artifacts could not be written
    Internal,            ///< A pass found an invariant of an earlier pass broken
};

/// Returns the stable diagnostic code for an error kind (e.g. "G002").
[[nodiscard]] auto error_code(ErrorKind kind) -> const char*;

/// Returns the human-readable name of an error kind (e.g. "CyclicInstantiation").
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

/// A structured backend error.
///
/// `module` and `symbol` identify the originating entity; `span` is copied
/// from the Program Tree node that triggered the error when one exists.
struct Diagnostic {
    ErrorKind kind = ErrorKind::Internal;

    /// Module being compiled when the error was raised.
    std::string module;

    /// Originating symbol (type, function, or mangled name), may be empty.
    std::string symbol;

    /// Primary message.
    std::string message;

    /// Source location, when the tree carried one.
    std::optional<SourceSpan> span;

    /// Additional context lines.
    std::vector<std::string> notes;

    [[nodiscard]] auto code() const -> const char* {
        return error_code(kind);
    }

    /// Adds a note and returns the diagnostic for chaining.
    auto with_note(std::string note) && -> Diagnostic {
        notes.push_back(std::move(note));
        return std::move(*this);
    }
};

/// Creates a diagnostic; a span without a known line is dropped.
[[nodiscard]] auto make_diagnostic(ErrorKind kind, std::string module, std::string symbol,
                                   std::string message, const SourceSpan& span = {})
    -> Diagnostic;

/// One-line summary used by log messages: `G002 [list] List_int: message (file:3:5)`.
[[nodiscard]] auto summarize(const Diagnostic& diag) -> std::string;

} // namespace a2c::diag

#endif // A2C_DIAG_DIAGNOSTIC_HPP
