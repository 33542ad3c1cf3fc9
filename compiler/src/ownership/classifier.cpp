//! # Ownership Classifier - Slot Classification
//!
//! Every slot is classified exactly once, here. Sizes come from the same
//! `SizeOracle` the layout compiler uses, so the "small aggregate" decision
//! agrees with the emitted struct layout.

#include "ownership/classifier.hpp"

#include "log/log.hpp"

namespace a2c::ownership {

using tree::ParamIntent;
using tree::PassingMode;

auto OwnershipClassifier::classify_param(const tree::ParamDecl& param, bool is_lowlevel,
                                         const std::string& owner)
    -> Result<PassingMode, diag::Diagnostic> {
    if (param.type && param.type->is<types::IndirectType>()) {
        return PassingMode::Pointer;
    }

    if (param.intent == ParamIntent::AddressOf) {
        if (!is_lowlevel) {
            return diag::make_diagnostic(
                diag::ErrorKind::OwnershipViolation, module_.name, owner,
                "parameter '" + param.name + "' takes an address outside low-level code",
                param.span);
        }
        return PassingMode::Pointer;
    }

    // C passes arrays as a pointer to their first element, so no size
    // makes them a copy
    if (param.type && param.type->is<types::ArrayType>()) {
        return param.intent == ParamIntent::Mutate ? PassingMode::RefMutable
                                                   : PassingMode::RefImmutable;
    }

    auto size = oracle_.size_of(param.type, param.span);
    if (is_err(size)) {
        return unwrap_err(size);
    }
    const auto& info = unwrap(size);
    if (!info.heap_backed && info.size <= options_.small_aggregate_limit) {
        return PassingMode::Copy;
    }

    switch (param.intent) {
    case ParamIntent::Read:
        return PassingMode::RefImmutable;
    case ParamIntent::Mutate:
        return PassingMode::RefMutable;
    case ParamIntent::Transfer:
        return PassingMode::Copy;
    case ParamIntent::AddressOf:
        break;
    }
    return PassingMode::Pointer;
}

auto OwnershipClassifier::classify_receiver(const tree::MethodDecl& method) -> PassingMode {
    return method.mutates_receiver ? PassingMode::RefMutable : PassingMode::RefImmutable;
}

auto OwnershipClassifier::classify_return(const types::TypePtr& type) -> PassingMode {
    return type && type->is<types::IndirectType>() ? PassingMode::Pointer : PassingMode::Copy;
}

auto OwnershipClassifier::check_return(const types::TypePtr& type, const std::string& owner,
                                       const SourceSpan& span) -> Result<Unit, diag::Diagnostic> {
    if (type && type->is<types::ArrayType>()) {
        return diag::make_diagnostic(diag::ErrorKind::InvalidLayout, module_.name, owner,
                                     "'" + owner + "' returns the array type '" +
                                         types::type_to_string(type) +
                                         "' by value, which C cannot return",
                                     span);
    }
    return Unit{};
}

auto OwnershipClassifier::classify_function(tree::FuncDecl& func)
    -> Result<Unit, diag::Diagnostic> {
    for (auto& param : func.params) {
        auto mode = classify_param(param, func.is_lowlevel, func.name);
        if (is_err(mode)) {
            return unwrap_err(mode);
        }
        param.passing = unwrap(mode);
        A2C_LOG_TRACE("ownership", func.name << "(" << param.name << "): "
                                             << tree::passing_mode_name(*param.passing));
    }
    auto returned = check_return(func.return_type, func.name, func.span);
    if (is_err(returned)) {
        return unwrap_err(returned);
    }
    func.return_passing = classify_return(func.return_type);
    return Unit{};
}

auto OwnershipClassifier::classify_method(tree::TypeDecl& owner, tree::MethodDecl& method)
    -> Result<Unit, diag::Diagnostic> {
    const auto symbol = owner.name + "." + method.name;
    for (auto& param : method.params) {
        auto mode = classify_param(param, method.is_lowlevel, symbol);
        if (is_err(mode)) {
            return unwrap_err(mode);
        }
        param.passing = unwrap(mode);
        A2C_LOG_TRACE("ownership", symbol << "(" << param.name << "): "
                                          << tree::passing_mode_name(*param.passing));
    }
    if (method.kind == tree::MethodKind::Instance) {
        method.receiver_passing = classify_receiver(method);
    }
    auto returned = check_return(method.return_type, symbol, method.span);
    if (is_err(returned)) {
        return unwrap_err(returned);
    }
    method.return_passing = classify_return(method.return_type);
    return Unit{};
}

auto OwnershipClassifier::run() -> Result<Unit, diag::Diagnostic> {
    A2C_LOG_DEBUG("ownership", "Classifying slots of " << module_.name);

    size_t slots = 0;
    for (auto& decl : module_.types) {
        for (auto& method : decl.methods) {
            auto classified = classify_method(decl, method);
            if (is_err(classified)) {
                return unwrap_err(classified);
            }
            slots += method.params.size() + (method.receiver_passing ? 2 : 1);
        }
    }
    for (auto& func : module_.functions) {
        auto classified = classify_function(func);
        if (is_err(classified)) {
            return unwrap_err(classified);
        }
        slots += func.params.size() + 1;
    }
    A2C_LOG_DEBUG("ownership", module_.name << ": " << slots << " slots classified");

    MutabilityChecker checker(index_, module_.name);
    for (const auto& decl : module_.types) {
        for (const auto& method : decl.methods) {
            if (method.is_stub())
                continue;
            auto checked = checker.check_method(decl, method);
            if (is_err(checked)) {
                return unwrap_err(checked);
            }
        }
    }
    for (const auto& func : module_.functions) {
        if (func.is_stub())
            continue;
        auto checked = checker.check_function(func);
        if (is_err(checked)) {
            return unwrap_err(checked);
        }
    }
    return Unit{};
}

namespace {

auto unclassified(const std::string& module, const std::string& symbol, const std::string& slot)
    -> diag::Diagnostic {
    return diag::make_diagnostic(diag::ErrorKind::Internal, module, symbol,
                                 slot + " reached lowering without a passing mode");
}

} // namespace

auto verify_classified(const tree::LoweredModule& module) -> Result<Unit, diag::Diagnostic> {
    for (const auto& decl : module.types) {
        for (const auto& method : decl.methods) {
            const auto symbol = decl.name + "." + method.name;
            for (const auto& param : method.params) {
                if (!param.passing)
                    return unclassified(module.name, symbol, "parameter '" + param.name + "'");
            }
            if (method.kind == tree::MethodKind::Instance && !method.receiver_passing)
                return unclassified(module.name, symbol, "receiver");
            if (!method.return_passing)
                return unclassified(module.name, symbol, "return slot");
        }
    }
    for (const auto& func : module.functions) {
        for (const auto& param : func.params) {
            if (!param.passing)
                return unclassified(module.name, func.name, "parameter '" + param.name + "'");
        }
        if (!func.return_passing)
            return unclassified(module.name, func.name, "return slot");
    }
    return Unit{};
}

} // namespace a2c::ownership
