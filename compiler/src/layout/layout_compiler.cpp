#include "layout/layout_compiler.hpp"

#include "log/log.hpp"

namespace a2c::layout {

auto record_name(const types::TypePtr& type) -> std::optional<std::string> {
    auto t = type;
    while (t && (t->is<types::IndirectType>() || t->is<types::PtrType>())) {
        t = t->is<types::IndirectType>() ? t->as<types::IndirectType>().inner
                                         : t->as<types::PtrType>().inner;
    }
    if (t && t->is<types::NamedType>()) {
        return t->as<types::NamedType>().name;
    }
    return std::nullopt;
}

auto LayoutTable::find_tag(const std::string& name) const -> const TagLayout* {
    auto it = tags.find(name);
    return it != tags.end() ? &it->second : nullptr;
}

auto LayoutTable::tag_of(const types::TypePtr& type) const -> const TagLayout* {
    auto name = record_name(type);
    return name ? find_tag(*name) : nullptr;
}

auto LayoutCompiler::ensure_tag(const std::string& name) -> Result<Unit, diag::Diagnostic> {
    if (table_.tags.count(name) > 0) {
        return Unit{};
    }
    const auto* decl = index_.find_type(name);
    if (!decl || !decl->is_tag) {
        return Unit{};
    }
    auto layout = compute_tag_layout(*decl, index_.local().name);
    if (is_err(layout)) {
        return unwrap_err(layout);
    }
    table_.tags.emplace(name, std::move(unwrap(layout)));
    return Unit{};
}

auto LayoutCompiler::run() -> Result<LayoutTable, diag::Diagnostic> {
    const auto& module = index_.local();
    A2C_LOG_DEBUG("layout", "Computing layouts for " << module.name);

    for (const auto& decl : module.types) {
        if (decl.is_tag) {
            auto tag = ensure_tag(decl.name);
            if (is_err(tag))
                return unwrap_err(tag);
        }
        auto size = oracle_.size_of_decl(decl);
        if (is_err(size))
            return unwrap_err(size);
    }

    for (const auto& decl : module.types) {
        for (const auto& method : decl.methods) {
            if (!method.body)
                continue;
            auto checked = check_body(*method.body);
            if (is_err(checked))
                return unwrap_err(checked);
        }
    }
    for (const auto& func : module.functions) {
        if (!func.body)
            continue;
        auto checked = check_body(*func.body);
        if (is_err(checked))
            return unwrap_err(checked);
    }

    table_.sizes = oracle_.computed();
    A2C_LOG_DEBUG("layout", module.name << ": " << table_.tags.size() << " tag layouts, "
                                        << table_.sizes.size() << " sized types");
    return std::move(table_);
}

auto LayoutCompiler::check_body(const tree::Expr& body) -> Result<Unit, diag::Diagnostic> {
    std::optional<diag::Diagnostic> error;

    tree::for_each_expr(body, [this, &error](const tree::Expr& expr) {
        if (error)
            return;
        if (expr.is<tree::VariantExpr>()) {
            // Constructing an imported tag needs its layout too
            if (auto name = record_name(expr.type())) {
                auto ensured = ensure_tag(*name);
                if (is_err(ensured))
                    error = unwrap_err(ensured);
            }
            return;
        }
        if (!expr.is<tree::MatchExpr>())
            return;
        const auto& match = expr.as<tree::MatchExpr>();

        if (auto name = record_name(match.scrutinee->type())) {
            auto ensured = ensure_tag(*name);
            if (is_err(ensured)) {
                error = unwrap_err(ensured);
                return;
            }
            if (!table_.find_tag(*name)) {
                error = diag::make_diagnostic(diag::ErrorKind::MalformedTree,
                                              index_.local().name, *name,
                                              "match over '" + *name + "', which is not a tag type",
                                              match.span);
                return;
            }
        }

        auto plan = plan_match(match, table_.tag_of(match.scrutinee->type()), index_.local().name);
        if (is_err(plan)) {
            error = unwrap_err(plan);
        }
    });

    if (error) {
        return *error;
    }
    return Unit{};
}

} // namespace a2c::layout
