//! # C Type Mapping
//!
//! | Type             | C                 |
//! |------------------|-------------------|
//! | `int` / `uint`   | `int` / `unsigned int` |
//! | `i8` .. `u64`    | `int8_t` .. `uint64_t` |
//! | `float`/`double` | `float` / `double`|
//! | `bool`, `char`   | `bool`, `char`    |
//! | `str`            | `char*`           |
//! | `void`           | `void`            |
//! | record / tag     | `struct Name`     |
//! | `*T`, `ref T`    | `T*`              |
//! | `[N]T`           | `T name[N]`       |

#pragma once

#include "types/type.hpp"

namespace a2c::codegen {

/// C spelling of a type, without array dimensions.
[[nodiscard]] auto c_type(const types::TypePtr& type) -> std::string;

/// Declarator of a variable or field: `int x`, `int xs[4]`, `struct P *p`.
[[nodiscard]] auto c_declare(const types::TypePtr& type, const std::string& name) -> std::string;

/// Quoted, escaped C string literal.
[[nodiscard]] auto c_string_literal(const std::string& value) -> std::string;

/// Quoted, escaped C character literal.
[[nodiscard]] auto c_char_literal(char value) -> std::string;

/// `double` literal that always reads back as floating point in C.
[[nodiscard]] auto c_float_literal(double value) -> std::string;

/// Uppercase identifier with every non-alphanumeric character replaced by `_`.
[[nodiscard]] auto c_macro_name(const std::string& text) -> std::string;

} // namespace a2c::codegen
