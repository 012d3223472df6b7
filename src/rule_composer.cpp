#include "rule_composer.hpp"
#include "unicode.hpp"
#include <algorithm>

namespace textseg {

RuleComposer::RuleComposer()
    : table_(kRuleTable.begin(), kRuleTable.end())
{
}

RuleComposer::RuleComposer(std::vector<RuleDescriptor> table)
    : table_(std::move(table))
{
    for (size_t i = 0; i < table_.size(); ++i) {
        if (static_cast<size_t>(table_[i].id) != i) {
            throw RuleConfigError("rule table row " + std::to_string(i) + " is out of RuleId order");
        }
    }
}

const RuleDescriptor& RuleComposer::descriptor(RuleId id) const {
    size_t idx = static_cast<size_t>(id);
    if (idx >= table_.size()) {
        throw RuleConfigError("rule " + std::string(rule_key(id)) + " missing from rule table");
    }
    return table_[idx];
}

void RuleComposer::add_with_dependencies(RuleId id, RuleSet dropped, RuleSet& resolved, RuleSet& visiting) const {
    if (resolved.contains(id)) return;
    if (visiting.contains(id)) {
        throw RuleConfigError("dependency cycle through rule " + std::string(descriptor(id).key));
    }
    visiting.insert(id);

    const RuleDescriptor& desc = descriptor(id);
    for (RuleId dep : desc.depends_on.to_vector()) {
        if (dropped.contains(dep)) {
            throw RuleConfigError("rule " + std::string(desc.key) + " depends on " +
                                  std::string(descriptor(dep).key) + ", which a conflict removed");
        }
        add_with_dependencies(dep, dropped, resolved, visiting);
    }

    visiting.erase(id);
    resolved.insert(id);
}

Resolution RuleComposer::resolve(RuleSet selected) const {
    Resolution res;

    // 1. Conflicts: the declaring rule wins
    RuleSet kept = selected;
    RuleSet dropped;
    for (RuleId id : selected.to_vector()) {
        const RuleDescriptor& desc = descriptor(id);
        if (!kept.contains(id)) continue;
        for (RuleId loser : desc.conflicts_with.to_vector()) {
            if (!kept.contains(loser)) continue;
            kept.erase(loser);
            dropped.insert(loser);
            res.conflicts.push_back({loser, "skipped", std::string(desc.conflict_reason)});
        }
    }

    // 2. Dependencies, transitively
    RuleSet resolved;
    for (RuleId id : kept.to_vector()) {
        RuleSet visiting;
        add_with_dependencies(id, dropped, resolved, visiting);
    }

    // 3. Ordering
    std::vector<RuleId> split_rules;
    std::vector<RuleId> remove_rules;
    for (RuleId id : resolved.to_vector()) {
        if (descriptor(id).group == RuleGroup::Split) {
            split_rules.push_back(id);
        } else {
            remove_rules.push_back(id);
        }
    }
    auto by_priority = [this](RuleId a, RuleId b) {
        return descriptor(a).priority < descriptor(b).priority;
    };
    std::stable_sort(split_rules.begin(), split_rules.end(), by_priority);
    std::stable_sort(remove_rules.begin(), remove_rules.end(), by_priority);

    res.applied_rules = std::move(split_rules);
    res.applied_rules.insert(res.applied_rules.end(), remove_rules.begin(), remove_rules.end());
    return res;
}

CompositionResult RuleComposer::compose(std::string_view text, RuleSet selected, bool naming_strip_separators) const {
    CompositionResult result;
    if (is_blank(text)) {
        return result;
    }

    Resolution res = resolve(selected);

    // 4. Fold
    std::vector<std::string> tokens{std::string(text)};
    for (RuleId id : res.applied_rules) {
        tokens = apply_rule(id, tokens, naming_strip_separators);
        tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                    [](const std::string& t) { return t.empty(); }),
                     tokens.end());
    }

    result.tokens = std::move(tokens);
    result.applied_rules = std::move(res.applied_rules);
    result.conflicts = std::move(res.conflicts);
    return result;
}

} // namespace textseg
