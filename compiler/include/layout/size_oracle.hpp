//! # Size Oracle
//!
//! Computes the C size, alignment and heap-backing of concrete types on an
//! LP64 target. The ownership classifier uses it to pick passing modes.
//!
//! | Type                      | Size / align                         |
//! |---------------------------|--------------------------------------|
//! | `i8`, `u8`, `bool`, `char`| 1 / 1                                |
//! | `i16`, `u16`              | 2 / 2                                |
//! | `int`, `uint`, `float`    | 4 / 4                                |
//! | `i64`, `u64`, `double`    | 8 / 8                                |
//! | `str`, `*T`, `ref T`      | 8 / 8                                |
//! | `[N]T`                    | N * size(T) / align(T)               |
//! | record                    | C struct layout of its fields        |
//! | tag                       | 4-byte discriminant + payload union  |
//!
//! A type is heap-backed when its declaration says so or when it stores a
//! heap-backed type by value. A record reaching itself by value has no
//! finite size (`InvalidLayout`).

#pragma once

#include "diag/diagnostic.hpp"
#include "tree/tree.hpp"

#include <map>

namespace a2c::layout {

struct SizeInfo {
    size_t size = 0;
    size_t align = 1;
    bool heap_backed = false;
};

class SizeOracle {
public:
    SizeOracle(const tree::DeclIndex& index, std::string module)
        : index_(index), module_(std::move(module)) {}

    [[nodiscard]] auto size_of(const types::TypePtr& type, const SourceSpan& span = {})
        -> Result<SizeInfo, diag::Diagnostic>;

    [[nodiscard]] auto size_of_decl(const tree::TypeDecl& decl)
        -> Result<SizeInfo, diag::Diagnostic>;

    /// Sizes computed so far, by type name.
    [[nodiscard]] auto computed() const -> const std::map<std::string, SizeInfo>& {
        return cache_;
    }

private:
    const tree::DeclIndex& index_;
    std::string module_;
    std::map<std::string, SizeInfo> cache_;
    std::vector<std::string> visiting_;

    [[nodiscard]] auto struct_layout(const std::vector<tree::FieldDecl>& fields,
                                     const SourceSpan& span) -> Result<SizeInfo, diag::Diagnostic>;
};

[[nodiscard]] inline auto align_up(size_t value, size_t align) -> size_t {
    return align == 0 ? value : (value + align - 1) / align * align;
}

} // namespace a2c::layout
