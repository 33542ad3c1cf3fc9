//! # Type Implementation
//!
//! This file implements type creation and manipulation functions.
//!
//! ## Type Factory Functions
//!
//! | Function           | Creates                          |
//! |--------------------|----------------------------------|
//! | `make_primitive`   | I8-U64, F32, F64, Bool, ...      |
//! | `make_i32`, etc.   | Convenience for common types     |
//! | `make_named`       | Records and tags                 |
//! | `make_ptr`         | Pointer types (`*T`)             |
//! | `make_array`       | Fixed-size arrays `[N]T`         |
//! | `make_indirect`    | Indirection marker               |
//!
//! ## Type Comparison
//!
//! `types_equal()` performs structural equality checking. Types carry no
//! identity; two separately built `List<int>` references are equal.

#include "types/type.hpp"

#include <sstream>

namespace a2c::types {

auto make_primitive(PrimitiveKind kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = PrimitiveType{kind};
    return type;
}

auto make_unit() -> TypePtr {
    return make_primitive(PrimitiveKind::Unit);
}

auto make_bool() -> TypePtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_i32() -> TypePtr {
    return make_primitive(PrimitiveKind::I32);
}

auto make_i64() -> TypePtr {
    return make_primitive(PrimitiveKind::I64);
}

auto make_u32() -> TypePtr {
    return make_primitive(PrimitiveKind::U32);
}

auto make_f64() -> TypePtr {
    return make_primitive(PrimitiveKind::F64);
}

auto make_char() -> TypePtr {
    return make_primitive(PrimitiveKind::Char);
}

auto make_str() -> TypePtr {
    return make_primitive(PrimitiveKind::Str);
}

auto make_named(std::string name, std::vector<TypePtr> type_args) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = NamedType{std::move(name), std::move(type_args)};
    return type;
}

auto make_ptr(TypePtr inner, bool is_mut) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = PtrType{is_mut, std::move(inner)};
    return type;
}

auto make_array(TypePtr element, size_t size) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = ArrayType{std::move(element), size};
    return type;
}

auto make_generic(std::string name) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = GenericType{std::move(name)};
    return type;
}

auto make_indirect(TypePtr inner) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = IndirectType{std::move(inner)};
    return type;
}

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::I8:
        return "i8";
    case PrimitiveKind::I16:
        return "i16";
    case PrimitiveKind::I32:
        return "int";
    case PrimitiveKind::I64:
        return "i64";
    case PrimitiveKind::U8:
        return "u8";
    case PrimitiveKind::U16:
        return "u16";
    case PrimitiveKind::U32:
        return "uint";
    case PrimitiveKind::U64:
        return "u64";
    case PrimitiveKind::F32:
        return "float";
    case PrimitiveKind::F64:
        return "double";
    case PrimitiveKind::Bool:
        return "bool";
    case PrimitiveKind::Char:
        return "char";
    case PrimitiveKind::Str:
        return "str";
    case PrimitiveKind::Unit:
        return "void";
    }
    return "unknown";
}

auto type_to_string(const TypePtr& type) -> std::string {
    if (!type)
        return "<null>";

    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, NamedType>) {
                std::ostringstream ss;
                ss << t.name;
                if (!t.type_args.empty()) {
                    ss << "<";
                    for (size_t i = 0; i < t.type_args.size(); ++i) {
                        if (i > 0)
                            ss << ", ";
                        ss << type_to_string(t.type_args[i]);
                    }
                    ss << ">";
                }
                return ss.str();
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return (t.is_mut ? "*mut " : "*") + type_to_string(t.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return "[" + std::to_string(t.size) + "]" + type_to_string(t.element);
            } else if constexpr (std::is_same_v<T, GenericType>) {
                return t.name;
            } else if constexpr (std::is_same_v<T, IndirectType>) {
                return "ref " + type_to_string(t.inner);
            } else {
                return "<unknown>";
            }
        },
        type->kind);
}

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (!a && !b)
        return true;
    if (!a || !b)
        return false;
    if (a.get() == b.get())
        return true;

    return std::visit(
        [&b](const auto& ta) -> bool {
            using T = std::decay_t<decltype(ta)>;

            if (!std::holds_alternative<T>(b->kind))
                return false;
            const auto& tb = std::get<T>(b->kind);

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return ta.kind == tb.kind;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                if (ta.name != tb.name)
                    return false;
                if (ta.type_args.size() != tb.type_args.size())
                    return false;
                for (size_t i = 0; i < ta.type_args.size(); ++i) {
                    if (!types_equal(ta.type_args[i], tb.type_args[i]))
                        return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return ta.is_mut == tb.is_mut && types_equal(ta.inner, tb.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return ta.size == tb.size && types_equal(ta.element, tb.element);
            } else if constexpr (std::is_same_v<T, GenericType>) {
                return ta.name == tb.name;
            } else if constexpr (std::is_same_v<T, IndirectType>) {
                return types_equal(ta.inner, tb.inner);
            } else {
                return false;
            }
        },
        a->kind);
}

auto is_unit(const TypePtr& type) -> bool {
    if (!type)
        return true;
    if (!type->is<PrimitiveType>())
        return false;
    return type->as<PrimitiveType>().kind == PrimitiveKind::Unit;
}

auto is_integer(const TypePtr& type) -> bool {
    if (!type || !type->is<PrimitiveType>())
        return false;
    switch (type->as<PrimitiveType>().kind) {
    case PrimitiveKind::I8:
    case PrimitiveKind::I16:
    case PrimitiveKind::I32:
    case PrimitiveKind::I64:
    case PrimitiveKind::U8:
    case PrimitiveKind::U16:
    case PrimitiveKind::U32:
    case PrimitiveKind::U64:
    case PrimitiveKind::Char:
        return true;
    default:
        return false;
    }
}

auto contains_generic(const TypePtr& type) -> bool {
    if (!type)
        return false;

    return std::visit(
        [](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, GenericType>) {
                return true;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                for (const auto& arg : t.type_args) {
                    if (contains_generic(arg))
                        return true;
                }
                return false;
            } else if constexpr (std::is_same_v<T, PtrType> || std::is_same_v<T, IndirectType>) {
                return contains_generic(t.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return contains_generic(t.element);
            } else {
                return false;
            }
        },
        type->kind);
}

// Generic type substitution - replaces GenericType with concrete types
auto substitute_type(const TypePtr& type, const std::unordered_map<std::string, TypePtr>& subs)
    -> TypePtr {
    if (!type)
        return type;
    if (subs.empty())
        return type;

    return std::visit(
        [&subs, &type](const auto& t) -> TypePtr {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, GenericType>) {
                auto it = subs.find(t.name);
                if (it != subs.end()) {
                    return it->second;
                }
                // Not found in subs, return as-is (reported later as unbound)
                return type;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                if (t.type_args.empty()) {
                    return type;
                }
                std::vector<TypePtr> new_args;
                new_args.reserve(t.type_args.size());
                for (const auto& arg : t.type_args) {
                    new_args.push_back(substitute_type(arg, subs));
                }
                return make_named(t.name, std::move(new_args));
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return make_ptr(substitute_type(t.inner, subs), t.is_mut);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return make_array(substitute_type(t.element, subs), t.size);
            } else if constexpr (std::is_same_v<T, IndirectType>) {
                return make_indirect(substitute_type(t.inner, subs));
            } else {
                return type;
            }
        },
        type->kind);
}

} // namespace a2c::types
