//! # Generic Instantiations
//!
//! An instantiation is identified by its key: the generic's name plus the
//! canonical codes of its concrete type arguments. The key determines the
//! generated name, `Base_arg1_arg2`.
//!
//! ## Canonical Argument Codes
//!
//! | Argument          | Code               |
//! |-------------------|--------------------|
//! | `int`, `uint`     | `int`, `uint`      |
//! | `i8` .. `u64`     | `i8` .. `u64`      |
//! | `float`, `double` | `float`, `double`  |
//! | `bool`, `char`    | `bool`, `char`     |
//! | `str`, `void`     | `str`, `void`      |
//! | named type        | its (mangled) name |
//! | `*T`              | `ptr_<T>`          |
//! | `[N]T`            | `arr<N>_<T>`       |
//! | `ref T`           | `ref_<T>`          |
//!
//! ## Registry
//!
//! `InstantiationRegistry` is the naming authority shared by every module
//! of a build. It is the only place where one key receives its name, and it
//! rejects a second key that mangles to a name already taken.

#pragma once

#include "diag/diagnostic.hpp"
#include "types/type.hpp"

#include <compare>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace a2c::mono {

/// Identity of one instantiation: generic name + canonical argument codes.
struct InstantiationKey {
    std::string base;
    std::vector<std::string> args;

    auto operator<=>(const InstantiationKey&) const = default;
};

/// Source-like form for messages, e.g. `List<int>`.
[[nodiscard]] auto key_to_string(const InstantiationKey& key) -> std::string;

/// Canonical code of a concrete type argument. The type must not contain
/// generic parameters or unmangled type arguments.
[[nodiscard]] auto type_arg_code(const types::TypePtr& type) -> std::string;

/// Generated name of an instantiation: `base` joined with its codes by `_`.
[[nodiscard]] auto mangle_instance(const InstantiationKey& key) -> std::string;

enum class InstanceKind { Type, Function };

/// One entry of a module's instantiation table.
struct GenericInstantiation {
    InstantiationKey key;
    std::string name;
    InstanceKind kind = InstanceKind::Type;
    bool complete = false;
};

/// Thread-safe name registry shared by all modules of a build.
class InstantiationRegistry {
public:
    /// Returns the name for `key`, assigning it on first request.
    ///
    /// Fails with `SymbolCollision` when the mangled name already belongs to
    /// a different key.
    [[nodiscard]] auto intern(const InstantiationKey& key, const std::string& module)
        -> Result<std::string, diag::Diagnostic>;

    /// Name previously assigned to `key`, if any.
    [[nodiscard]] auto lookup(const InstantiationKey& key) const -> std::optional<std::string>;

    [[nodiscard]] auto size() const -> size_t;

    /// All assigned names in key order.
    [[nodiscard]] auto entries() const -> std::vector<std::pair<InstantiationKey, std::string>>;

private:
    mutable std::mutex mutex_;
    std::map<InstantiationKey, std::string> names_;
    std::map<std::string, InstantiationKey> owners_;
};

} // namespace a2c::mono
