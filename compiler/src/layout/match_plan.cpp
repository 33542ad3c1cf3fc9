#include "layout/match_plan.hpp"

#include "log/log.hpp"

#include <set>

namespace a2c::layout {

using diag::ErrorKind;

namespace {

auto is_bool(const types::TypePtr& type) -> bool {
    return type && type->is<types::PrimitiveType>() &&
           type->as<types::PrimitiveType>().kind == types::PrimitiveKind::Bool;
}

auto malformed(const std::string& module, std::string message, const SourceSpan& span)
    -> diag::Diagnostic {
    return diag::make_diagnostic(ErrorKind::MalformedTree, module, "", std::move(message), span);
}

} // namespace

auto plan_match(const tree::MatchExpr& match, const TagLayout* tag, const std::string& module)
    -> Result<MatchPlan, diag::Diagnostic> {
    MatchPlan plan;
    plan.on_tag = tag != nullptr;

    std::set<std::string> covered_variants;
    std::set<int64_t> covered_values;

    for (size_t i = 0; i < match.arms.size(); ++i) {
        const auto& pattern = match.arms[i].pattern;
        const auto& span = pattern.span.is_known() ? pattern.span : match.span;

        if (pattern.is_catch_all()) {
            plan.default_arm = i;
            if (pattern.is<tree::BindingPattern>()) {
                plan.default_binding = pattern.as<tree::BindingPattern>().name;
            }
            if (i + 1 < match.arms.size()) {
                A2C_LOG_TRACE("layout", "Dropping " << match.arms.size() - i - 1
                                                    << " arm(s) after catch-all");
            }
            break;
        }

        if (pattern.is<tree::VariantPattern>()) {
            const auto& vp = pattern.as<tree::VariantPattern>();
            if (!tag) {
                return malformed(module, "variant pattern '" + vp.variant +
                                             "' used in a match over a scalar",
                                 span);
            }
            const auto* variant = tag->find_variant(vp.variant);
            if (!variant) {
                return malformed(module, "'" + tag->tag_name + "' has no variant '" + vp.variant +
                                             "'",
                                 span);
            }
            if (vp.bindings.size() > variant->fields.size()) {
                return malformed(module, "pattern binds " + std::to_string(vp.bindings.size()) +
                                             " field(s) of '" + vp.variant + "', which has " +
                                             std::to_string(variant->fields.size()),
                                 span);
            }
            if (!covered_variants.insert(vp.variant).second) {
                A2C_LOG_TRACE("layout", "Dropping repeated arm for " << vp.variant);
                continue;
            }

            MatchCase c;
            c.arm = i;
            c.label = variant->constant;
            for (size_t f = 0; f < vp.bindings.size(); ++f) {
                const auto& name = vp.bindings[f];
                if (name.empty() || name == "_")
                    continue;
                c.bindings.push_back(
                    PayloadBinding{name, variant->access_path(f), variant->fields[f].type});
            }
            plan.cases.push_back(std::move(c));
            continue;
        }

        // Literal pattern
        const auto value = pattern.as<tree::LiteralPattern>().value;
        if (tag) {
            return malformed(module, "literal pattern used in a match over '" + tag->tag_name + "'",
                             span);
        }
        if (!covered_values.insert(value).second) {
            continue;
        }
        MatchCase c;
        c.arm = i;
        c.label = std::to_string(value);
        plan.cases.push_back(std::move(c));
    }

    if (plan.default_arm) {
        return plan;
    }

    if (tag) {
        std::string missing;
        for (const auto& variant : tag->variants) {
            if (covered_variants.count(variant.name) == 0) {
                if (!missing.empty())
                    missing += ", ";
                missing += variant.name;
            }
        }
        if (!missing.empty()) {
            return diag::make_diagnostic(ErrorKind::NonExhaustiveMatch, module, tag->tag_name,
                                         "match over '" + tag->tag_name +
                                             "' does not cover: " + missing,
                                         match.span);
        }
        return plan;
    }

    const auto scrutinee_type = match.scrutinee->type();
    if (is_bool(scrutinee_type) && covered_values.count(0) > 0 && covered_values.count(1) > 0) {
        return plan;
    }
    return diag::make_diagnostic(ErrorKind::NonExhaustiveMatch, module,
                                 types::type_to_string(scrutinee_type),
                                 "match over '" + types::type_to_string(scrutinee_type) +
                                     "' needs a catch-all arm",
                                 match.span);
}

} // namespace a2c::layout
