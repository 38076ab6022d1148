//! # Rule Table
//!
//! Codes, messages, the scope context and the default rule list.

#include "rules/rules.hpp"

namespace pmc::rules {

// ============================================================================
// Codes and Messages
// ============================================================================

auto rule_code(RuleId id) -> const char* {
    switch (id) {
    case RuleId::InplaceTrue:
        return "PMC001";
    case RuleId::ReassignmentCall:
        return "PMC002";
    case RuleId::ReassignmentSubscript:
        return "PMC003";
    case RuleId::AssignmentSubscript:
        return "PMC004";
    case RuleId::AssignmentAttribute:
        return "PMC005";
    case RuleId::AssignmentIndexColumns:
        return "PMC006";
    case RuleId::SelectionWithoutLambda:
        return "PMC007";
    }
    return "PMC???";
}

auto rule_message(RuleId id) -> const char* {
    switch (id) {
    case RuleId::InplaceTrue:
        return "usage of 'inplace=True' should be avoided";
    case RuleId::ReassignmentCall:
        return "reassignment using call could be replaced by method chaining";
    case RuleId::ReassignmentSubscript:
        return "reassignment using subscript could be replaced by method chaining";
    case RuleId::AssignmentSubscript:
        return "assignment using subscript could be replaced by 'assign()'";
    case RuleId::AssignmentAttribute:
        return "assignment using attribute could be replaced by 'assign()'";
    case RuleId::AssignmentIndexColumns:
        return "assignment of index or columns could be replaced by 'rename()'";
    case RuleId::SelectionWithoutLambda:
        return "selection reusing a variable could be performed with a lambda";
    }
    return "";
}

auto rule_from_code(std::string_view code) -> std::optional<RuleId> {
    for (RuleId id : ALL_RULES) {
        if (code == rule_code(id)) {
            return id;
        }
    }
    return std::nullopt;
}

// ============================================================================
// RuleContext
// ============================================================================

void RuleContext::bind(const std::string& name, uint8_t origins) {
    names_[name] |= origins;
}

auto RuleContext::has_origin(std::string_view name, BindingOrigin origin) const -> bool {
    auto it = names_.find(std::string(name));
    return it != names_.end() && (it->second & origin_bit(origin)) != 0;
}

// ============================================================================
// Rule List
// ============================================================================

auto make_rule(RuleId id) -> Box<Rule> {
    switch (id) {
    case RuleId::InplaceTrue:
        return make_box<InplaceRule>();
    case RuleId::ReassignmentCall:
        return make_box<ReassignmentCallRule>();
    case RuleId::ReassignmentSubscript:
        return make_box<ReassignmentSubscriptRule>();
    case RuleId::AssignmentSubscript:
        return make_box<AssignmentSubscriptRule>();
    case RuleId::AssignmentAttribute:
        return make_box<AssignmentAttributeRule>();
    case RuleId::AssignmentIndexColumns:
        return make_box<AssignmentIndexColumnsRule>();
    case RuleId::SelectionWithoutLambda:
        return make_box<SelectionRule>();
    }
    return nullptr;
}

auto default_rules() -> std::vector<Box<Rule>> {
    std::vector<Box<Rule>> rules;
    for (RuleId id :
         {RuleId::InplaceTrue, RuleId::ReassignmentCall, RuleId::ReassignmentSubscript,
          RuleId::AssignmentSubscript, RuleId::AssignmentIndexColumns,
          RuleId::AssignmentAttribute, RuleId::SelectionWithoutLambda}) {
        rules.push_back(make_rule(id));
    }
    return rules;
}

} // namespace pmc::rules
