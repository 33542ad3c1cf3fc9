//! # Fragment Sources
//!
//! A module is stored as up to two fragments, named by suffix:
//!
//! | Fragment            | Path              |
//! |---------------------|-------------------|
//! | Shared interface    | `<module>.at`     |
//! | Interpreter         | `<module>.vm.at`  |
//! | C translation       | `<module>.c.at`   |
//! | Rust translation    | `<module>.rust.at`|
//!
//! The backend never parses: a `FragmentProvider` hands out fragments that a
//! front end has already turned into resolved Program Trees.

#pragma once

#include "tree/tree.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace a2c::assemble {

/// Suffix of the scenario-specific fragment, e.g. `.c.at`.
[[nodiscard]] auto fragment_suffix(tree::Scenario scenario) -> std::string;

/// `<module>.at`
[[nodiscard]] auto shared_fragment_path(const std::string& module) -> std::string;

/// `<module>.c.at`, `<module>.vm.at` or `<module>.rust.at`
[[nodiscard]] auto specific_fragment_path(const std::string& module, tree::Scenario scenario)
    -> std::string;

/// Source of parsed fragments, keyed by fragment path.
class FragmentProvider {
public:
    virtual ~FragmentProvider() = default;

    /// Returns the fragment stored under `path`, or nullptr if absent.
    [[nodiscard]] virtual auto find(const std::string& path) const -> const tree::Fragment* = 0;

    /// Names of all modules with at least one fragment, sorted.
    [[nodiscard]] virtual auto modules() const -> std::vector<std::string> = 0;
};

/// In-memory provider, filled by a front end or by tests.
class MemoryFragmentProvider : public FragmentProvider {
public:
    /// Stores the shared fragment of `fragment.module`.
    void add_shared(tree::Fragment fragment);

    /// Stores the fragment of `fragment.module` specific to `scenario`.
    void add_specific(tree::Scenario scenario, tree::Fragment fragment);

    [[nodiscard]] auto find(const std::string& path) const -> const tree::Fragment* override;

    [[nodiscard]] auto modules() const -> std::vector<std::string> override;

private:
    std::map<std::string, tree::Fragment> fragments_;
    std::set<std::string> module_names_;
};

} // namespace a2c::assemble
