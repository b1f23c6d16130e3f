#include "policy/rule.hpp"

#include <spdlog/fmt/fmt.h>

std::string Policy::rule_id() const {
    return fmt::format("{}:{}", resource, action_to_string(action));
}

std::expected<PolicySet, std::string> PolicySet::create(std::vector<Policy> policies) {
    PolicySet set;
    for (std::size_t i = 0; i < policies.size(); ++i) {
        const Policy& p = policies[i];
        if (p.resource.empty()) {
            return std::unexpected(fmt::format("policies[{}]: resource must not be empty", i));
        }
        if (!p.allow) {
            return std::unexpected(fmt::format("policies[{}] ({}): allow expression is missing", i, p.rule_id()));
        }
        auto [it, inserted] = set.index_.try_emplace({p.resource, p.action}, i);
        if (!inserted) {
            return std::unexpected(fmt::format("policies[{}]: duplicate policy for {} (first defined at policies[{}])",
                                               i, p.rule_id(), it->second));
        }
    }
    set.policies_ = std::move(policies);
    return set;
}

const Policy* PolicySet::find(std::string_view resource, Action action) const {
    const auto it = index_.find({std::string{resource}, action});
    return it == index_.end() ? nullptr : &policies_[it->second];
}
