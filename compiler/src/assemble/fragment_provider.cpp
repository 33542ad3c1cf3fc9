#include "assemble/fragment_provider.hpp"

namespace a2c::assemble {

auto fragment_suffix(tree::Scenario scenario) -> std::string {
    switch (scenario) {
    case tree::Scenario::Interp:
        return ".vm.at";
    case tree::Scenario::TransC:
        return ".c.at";
    case tree::Scenario::TransRust:
        return ".rust.at";
    }
    return ".at";
}

auto shared_fragment_path(const std::string& module) -> std::string {
    return module + ".at";
}

auto specific_fragment_path(const std::string& module, tree::Scenario scenario) -> std::string {
    return module + fragment_suffix(scenario);
}

void MemoryFragmentProvider::add_shared(tree::Fragment fragment) {
    auto path = shared_fragment_path(fragment.module);
    fragment.role = tree::FragmentRole::Shared;
    fragment.path = path;
    module_names_.insert(fragment.module);
    fragments_.insert_or_assign(path, std::move(fragment));
}

void MemoryFragmentProvider::add_specific(tree::Scenario scenario, tree::Fragment fragment) {
    auto path = specific_fragment_path(fragment.module, scenario);
    fragment.role = tree::FragmentRole::Specific;
    fragment.path = path;
    module_names_.insert(fragment.module);
    fragments_.insert_or_assign(path, std::move(fragment));
}

auto MemoryFragmentProvider::find(const std::string& path) const -> const tree::Fragment* {
    auto it = fragments_.find(path);
    return it != fragments_.end() ? &it->second : nullptr;
}

auto MemoryFragmentProvider::modules() const -> std::vector<std::string> {
    return {module_names_.begin(), module_names_.end()};
}

} // namespace a2c::assemble
