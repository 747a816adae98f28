/// @file rules.cpp
/// @brief Implementation of the first-match rule list and context builders
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "rules.h"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace blankline_cpp {

// A rule scoped Both applies everywhere; otherwise scopes must agree.
bool Rule::appliesTo(ContextScope where) const {
    switch (scope) {
        case RuleScope::Both: return true;
        case RuleScope::Body: return where == ContextScope::Body;
        case RuleScope::Cell: return where == ContextScope::Cell;
    }
    return false;
}

Rules::Rules(std::vector<Rule> rules)
    : rules_(std::move(rules)) {}

void Rules::add(Rule rule) {
    rules_.push_back(std::move(rule));
}

void Rules::prepend(Rule rule) {
    rules_.insert(rules_.begin(), std::move(rule));
}

Rule const* Rules::findMatch(RuleContext const& context) const {
    for (auto const& rule : rules_) {
        if (!rule.appliesTo(context.scope)) continue;
        if (rule.matches && rule.matches(context)) {
            return &rule;
        }
    }
    return nullptr;
}

void Rules::forEach(std::function<void(Rule const&)> fn) const {
    for (auto const& rule : rules_) {
        fn(rule);
    }
}

RuleContext buildBodyContext(Document const& document, std::size_t index,
                             BlankLineOptions const* options) {
    std::size_t count = document.bodyElementCount();
    RuleContext context;
    context.document = &document;
    context.currentIndex = index;
    context.current = document.bodyElementAt(index);
    context.prev = index > 0 ? document.bodyElementAt(index - 1) : nullptr;
    context.next = index + 1 < count ? document.bodyElementAt(index + 1) : nullptr;
    context.scope = ContextScope::Body;
    context.options = options;
    return context;
}

RuleContext buildCellContext(Document const& document, TableCell const& cell,
                             std::size_t paraIndex, Table const& parentTable,
                             BlankLineOptions const* options) {
    RuleContext context;
    context.document = &document;
    context.currentIndex = paraIndex;
    context.scope = ContextScope::Cell;
    context.cell = &cell;
    context.cellParagraphs = cell.paragraphs();
    context.cellParaIndex = paraIndex;
    context.parentTable = &parentTable;
    context.options = options;

    auto const& paragraphs = context.cellParagraphs;
    if (paraIndex < paragraphs.size()) context.current = paragraphs[paraIndex];
    if (paraIndex > 0 && paraIndex - 1 < paragraphs.size()) context.prev = paragraphs[paraIndex - 1];
    if (paraIndex + 1 < paragraphs.size()) context.next = paragraphs[paraIndex + 1];
    return context;
}

} // namespace blankline_cpp
