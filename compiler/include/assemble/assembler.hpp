//! # Fragment Assembler
//!
//! Merges the scenario-specific fragment and the shared fragment of a module
//! into one `ModuleUnit`.
//!
//! ## Merge Order
//!
//! Scenario-specific declarations come first, shared declarations second.
//! A declaration present in both fragments is merged into the position of
//! the scenario-specific one.
//!
//! ## Merge Rules
//!
//! | Both sides declare            | Result                               |
//! |-------------------------------|--------------------------------------|
//! | type, one opaque              | structure from the non-opaque side   |
//! | type, both with structure     | `AssemblyConflict`                   |
//! | method/function, one body     | body from that side                  |
//! | method/function, two bodies   | `AssemblyConflict`                   |
//! | method/function, signatures differ | `AssemblyConflict`              |
//!
//! Declarations restricted to another scenario (`only_for`) are dropped
//! before merging. Two declarations of the same name inside one fragment are
//! an `AssemblyConflict`. A missing scenario fragment falls back to the
//! shared fragment alone; if neither exists the result is `ModuleNotFound`.

#pragma once

#include "assemble/fragment_provider.hpp"
#include "diag/diagnostic.hpp"

namespace a2c::assemble {

class Assembler {
public:
    explicit Assembler(const FragmentProvider& provider) : provider_(provider) {}

    /// Builds the merged unit of `module` for `scenario`.
    [[nodiscard]] auto assemble(const std::string& module, tree::Scenario scenario)
        -> Result<tree::ModuleUnit, diag::Diagnostic>;

private:
    const FragmentProvider& provider_;
};

} // namespace a2c::assemble
