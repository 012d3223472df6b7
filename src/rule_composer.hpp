#pragma once

#include "rules.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace textseg {

// Raised for a rule table that cannot be resolved (dependency cycle,
// dependency on a rule removed by a conflict)
class RuleConfigError : public std::runtime_error {
public:
    explicit RuleConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct ConflictRecord {
    RuleId rule;
    std::string action;   // always "skipped"
    std::string reason;
};

struct Resolution {
    std::vector<RuleId> applied_rules;   // split group, then remove group, by priority
    std::vector<ConflictRecord> conflicts;
};

struct CompositionResult {
    std::vector<std::string> tokens;
    std::vector<RuleId> applied_rules;
    std::vector<ConflictRecord> conflicts;
};

class RuleComposer {
public:
    // Uses the built-in rule catalogue
    RuleComposer();
    // Custom catalogue; rows must be indexed by RuleId
    explicit RuleComposer(std::vector<RuleDescriptor> table);

    Resolution resolve(RuleSet selected) const;

    CompositionResult compose(std::string_view text, RuleSet selected, bool naming_strip_separators = true) const;

private:
    std::vector<RuleDescriptor> table_;

    const RuleDescriptor& descriptor(RuleId id) const;
    void add_with_dependencies(RuleId id, RuleSet dropped, RuleSet& resolved, RuleSet& visiting) const;
};

} // namespace textseg
