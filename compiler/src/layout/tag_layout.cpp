#include "layout/tag_layout.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace a2c::layout {

namespace {

auto to_upper(const std::string& s) -> std::string {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

auto VariantLayout::access_path(size_t index) const -> std::string {
    switch (storage) {
    case PayloadStorage::None:
        return "";
    case PayloadStorage::Direct:
        return "as." + name;
    case PayloadStorage::Struct:
        return "as." + name + "." + fields[index].name;
    }
    return "";
}

auto TagLayout::find_variant(const std::string& variant) const -> const VariantLayout* {
    for (const auto& v : variants) {
        if (v.name == variant)
            return &v;
    }
    return nullptr;
}

auto variant_constant(const std::string& tag, const std::string& variant) -> std::string {
    return to_upper(tag) + "_" + to_upper(variant);
}

auto compute_tag_layout(const tree::TypeDecl& decl, const std::string& module)
    -> Result<TagLayout, diag::Diagnostic> {
    TagLayout layout;
    layout.tag_name = decl.name;
    layout.enum_name = decl.name + "Kind";

    std::set<int64_t> pinned;
    for (const auto& variant : decl.variants) {
        if (variant.discriminant)
            pinned.insert(*variant.discriminant);
    }

    std::map<int64_t, std::string> used;
    std::optional<int64_t> highest;
    for (const auto& variant : decl.variants) {
        int64_t value = 0;
        if (variant.discriminant) {
            value = *variant.discriminant;
        } else {
            value = highest ? *highest + 1 : 0;
            while (pinned.count(value) > 0) {
                ++value;
            }
        }

        auto [it, inserted] = used.emplace(value, variant.name);
        if (!inserted) {
            return diag::make_diagnostic(diag::ErrorKind::InvalidLayout, module, decl.name,
                                         "variants '" + it->second + "' and '" + variant.name +
                                             "' of '" + decl.name + "' share discriminant " +
                                             std::to_string(value),
                                         variant.span.is_known() ? variant.span : decl.span);
        }
        if (!highest || value > *highest) {
            highest = value;
        }

        VariantLayout v;
        v.name = variant.name;
        v.constant = variant_constant(decl.name, variant.name);
        v.discriminant = value;
        v.fields = variant.fields;
        if (variant.fields.empty()) {
            v.storage = PayloadStorage::None;
        } else if (variant.fields.size() == 1) {
            v.storage = PayloadStorage::Direct;
        } else {
            v.storage = PayloadStorage::Struct;
        }
        layout.has_payload = layout.has_payload || !variant.fields.empty();

        A2C_LOG_TRACE("layout", decl.name << "." << variant.name << " = " << value);
        layout.variants.push_back(std::move(v));
    }

    return layout;
}

} // namespace a2c::layout
