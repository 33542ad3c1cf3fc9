#include "mono/instantiation.hpp"

#include "log/log.hpp"

#include <sstream>

namespace a2c::mono {

auto key_to_string(const InstantiationKey& key) -> std::string {
    std::ostringstream oss;
    oss << key.base << "<";
    for (size_t i = 0; i < key.args.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << key.args[i];
    }
    oss << ">";
    return oss.str();
}

auto type_arg_code(const types::TypePtr& type) -> std::string {
    if (!type)
        return "void";

    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, types::PrimitiveType>) {
                return types::primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, types::NamedType>) {
                return t.name;
            } else if constexpr (std::is_same_v<T, types::PtrType>) {
                return "ptr_" + type_arg_code(t.inner);
            } else if constexpr (std::is_same_v<T, types::ArrayType>) {
                return "arr" + std::to_string(t.size) + "_" + type_arg_code(t.element);
            } else if constexpr (std::is_same_v<T, types::IndirectType>) {
                return "ref_" + type_arg_code(t.inner);
            } else {
                return t.name;
            }
        },
        type->kind);
}

auto mangle_instance(const InstantiationKey& key) -> std::string {
    std::string name = key.base;
    for (const auto& arg : key.args) {
        name += "_";
        name += arg;
    }
    return name;
}

auto InstantiationRegistry::intern(const InstantiationKey& key, const std::string& module)
    -> Result<std::string, diag::Diagnostic> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = names_.find(key);
    if (it != names_.end()) {
        return it->second;
    }

    auto name = mangle_instance(key);
    auto owner = owners_.find(name);
    if (owner != owners_.end()) {
        return diag::make_diagnostic(diag::ErrorKind::SymbolCollision, module, name,
                                     "instantiations " + key_to_string(owner->second) + " and " +
                                         key_to_string(key) + " both mangle to '" + name + "'");
    }

    names_.emplace(key, name);
    owners_.emplace(name, key);
    A2C_LOG_TRACE("mono", "Registered " << key_to_string(key) << " as " << name);
    return name;
}

auto InstantiationRegistry::lookup(const InstantiationKey& key) const
    -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(key);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto InstantiationRegistry::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

auto InstantiationRegistry::entries() const
    -> std::vector<std::pair<InstantiationKey, std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    return {names_.begin(), names_.end()};
}

} // namespace a2c::mono
