//! # Match Lowering Plans
//!
//! A match lowers to a C `switch`. The plan lists, per reachable arm, the
//! `case` label and the payload bindings it introduces; a catch-all arm
//! becomes `default`.
//!
//! ```c
//! switch (atom.tag) {
//! case ATOM_INT: {
//!     int i = atom.as.Int;
//!     ...
//! } break;
//! default: {
//!     ...
//! } break;
//! }
//! ```
//!
//! Arms after a catch-all, and arms repeating an already covered variant or
//! literal, are unreachable and dropped from the plan.

#pragma once

#include "layout/tag_layout.hpp"

namespace a2c::layout {

/// A payload field bound by a variant pattern.
struct PayloadBinding {
    std::string name;   ///< Local introduced by the pattern
    std::string access; ///< Path relative to the scrutinee, e.g. `as.Pair.x`
    types::TypePtr type;
};

struct MatchCase {
    size_t arm = 0;    ///< Index into `MatchExpr::arms`
    std::string label; ///< Enum constant or integer literal
    std::vector<PayloadBinding> bindings;
};

struct MatchPlan {
    bool on_tag = false; ///< Switch on `.tag` rather than on the value
    std::vector<MatchCase> cases;
    std::optional<size_t> default_arm;
    std::string default_binding; ///< Name bound by a catch-all binding pattern
};

/// Plans `match`. `tag` is the layout of the scrutinee's tag type, or null
/// for a match over an integer-like scalar.
///
/// Fails with `NonExhaustiveMatch` if variants are left uncovered without a
/// catch-all (a scalar match always needs one unless it covers both `bool`
/// values), and with `MalformedTree` for patterns that do not fit the
/// scrutinee.
[[nodiscard]] auto plan_match(const tree::MatchExpr& match, const TagLayout* tag,
                              const std::string& module) -> Result<MatchPlan, diag::Diagnostic>;

} // namespace a2c::layout
