#include "layout/size_oracle.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace a2c::layout {

using diag::ErrorKind;

namespace {

auto primitive_size(types::PrimitiveKind kind) -> SizeInfo {
    using types::PrimitiveKind;
    switch (kind) {
    case PrimitiveKind::I8:
    case PrimitiveKind::U8:
    case PrimitiveKind::Bool:
    case PrimitiveKind::Char:
        return {1, 1, false};
    case PrimitiveKind::I16:
    case PrimitiveKind::U16:
        return {2, 2, false};
    case PrimitiveKind::I32:
    case PrimitiveKind::U32:
    case PrimitiveKind::F32:
        return {4, 4, false};
    case PrimitiveKind::I64:
    case PrimitiveKind::U64:
    case PrimitiveKind::F64:
    case PrimitiveKind::Str:
        return {8, 8, false};
    case PrimitiveKind::Unit:
        return {0, 1, false};
    }
    return {0, 1, false};
}

constexpr SizeInfo POINTER_SIZE{8, 8, false};

// Discriminant enums are int-sized.
constexpr size_t TAG_SIZE = 4;

} // namespace

auto SizeOracle::size_of(const types::TypePtr& type, const SourceSpan& span)
    -> Result<SizeInfo, diag::Diagnostic> {
    if (!type) {
        return SizeInfo{0, 1, false};
    }

    if (type->is<types::PrimitiveType>()) {
        return primitive_size(type->as<types::PrimitiveType>().kind);
    }
    if (type->is<types::PtrType>() || type->is<types::IndirectType>()) {
        return POINTER_SIZE;
    }
    if (type->is<types::ArrayType>()) {
        const auto& arr = type->as<types::ArrayType>();
        auto element = size_of(arr.element, span);
        if (is_err(element))
            return element;
        auto info = unwrap(element);
        info.size *= arr.size;
        return info;
    }
    if (type->is<types::GenericType>()) {
        return diag::make_diagnostic(ErrorKind::Internal, module_,
                                     type->as<types::GenericType>().name,
                                     "generic parameter survived monomorphization", span);
    }

    const auto& named = type->as<types::NamedType>();
    const auto* decl = index_.find_type(named.name);
    if (!decl) {
        return diag::make_diagnostic(ErrorKind::MalformedTree, module_, named.name,
                                     "unknown type '" + named.name + "'", span);
    }
    return size_of_decl(*decl);
}

auto SizeOracle::size_of_decl(const tree::TypeDecl& decl) -> Result<SizeInfo, diag::Diagnostic> {
    auto cached = cache_.find(decl.name);
    if (cached != cache_.end()) {
        return cached->second;
    }

    if (std::find(visiting_.begin(), visiting_.end(), decl.name) != visiting_.end()) {
        std::string path;
        for (const auto& name : visiting_) {
            path += name + " -> ";
        }
        path += decl.name;
        return diag::make_diagnostic(ErrorKind::InvalidLayout, module_, decl.name,
                                     "'" + decl.name + "' contains itself by value (" + path +
                                         "); store it through an indirection",
                                     decl.span);
    }

    // Structure lives elsewhere; only ever handled through pointers.
    if (decl.is_opaque) {
        SizeInfo info{POINTER_SIZE.size, POINTER_SIZE.align, true};
        cache_.emplace(decl.name, info);
        return info;
    }

    visiting_.push_back(decl.name);
    SizeInfo info;

    if (!decl.is_tag) {
        auto record = struct_layout(decl.fields, decl.span);
        if (is_err(record)) {
            visiting_.pop_back();
            return record;
        }
        info = unwrap(record);
    } else {
        SizeInfo payload{0, 1, false};
        for (const auto& variant : decl.variants) {
            if (variant.fields.empty())
                continue;
            auto storage = struct_layout(variant.fields, variant.span);
            if (is_err(storage)) {
                visiting_.pop_back();
                return storage;
            }
            const auto& s = unwrap(storage);
            payload.size = std::max(payload.size, s.size);
            payload.align = std::max(payload.align, s.align);
            payload.heap_backed = payload.heap_backed || s.heap_backed;
        }
        info.align = std::max(TAG_SIZE, payload.align);
        info.size = align_up(align_up(TAG_SIZE, payload.align) + payload.size, info.align);
        info.heap_backed = payload.heap_backed;
    }

    info.heap_backed = info.heap_backed || decl.is_heap_backed;
    visiting_.pop_back();

    A2C_LOG_TRACE("layout", "sizeof(" << decl.name << ") = " << info.size << ", align "
                                      << info.align << (info.heap_backed ? ", heap-backed" : ""));
    cache_.emplace(decl.name, info);
    return info;
}

auto SizeOracle::struct_layout(const std::vector<tree::FieldDecl>& fields, const SourceSpan& span)
    -> Result<SizeInfo, diag::Diagnostic> {
    // Empty records are emitted with one placeholder byte.
    if (fields.empty()) {
        return SizeInfo{1, 1, false};
    }

    SizeInfo info{0, 1, false};
    for (const auto& field : fields) {
        auto field_size = size_of(field.type, field.span.is_known() ? field.span : span);
        if (is_err(field_size))
            return field_size;
        const auto& f = unwrap(field_size);
        info.size = align_up(info.size, f.align) + f.size;
        info.align = std::max(info.align, f.align);
        info.heap_backed = info.heap_backed || f.heap_backed;
    }
    info.size = align_up(info.size, info.align);
    return info;
}

} // namespace a2c::layout
