/// @file rules.h
/// @brief Blank-line rule model and first-match rule lists
///
/// A rule is a pure predicate over a RuleContext, tagged with an id, the
/// action it asks for (remove the blank here, or make sure one exists) and
/// the scope it applies to (body, table cell, or both).
///
/// @par Rule Precedence
///
/// Rules are kept in ordered lists and the engine always takes the first
/// rule whose scope fits and whose predicate matches. The order of the
/// lists is therefore part of their meaning:
/// -# Removal rules are evaluated for every blank paragraph
/// -# Addition rules are evaluated for every element
/// -# Positions no rule claims fall back to the original document
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_RULES_H
#define BLANKLINE_CPP_RULES_H

#include "document.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blankline_cpp {

struct BlankLineOptions;

/// @enum RuleAction
enum class RuleAction {
    Remove,
    Add
};

/// @enum RuleScope
/// @brief Where a rule applies
enum class RuleScope {
    Body,
    Cell,
    Both
};

/// @enum ContextScope
/// @brief Where a context was built
enum class ContextScope {
    Body,
    Cell
};

/// @struct RuleContext
/// @brief Everything a rule may look at for one position
///
/// Body contexts index body elements; cell contexts index the paragraphs of
/// one cell and also carry the cell, its paragraph list and its table.
/// Pointers that do not apply are null.
struct RuleContext {
    Document const* document = nullptr;
    std::size_t currentIndex = 0;
    Element const* current = nullptr;
    Element const* prev = nullptr;
    Element const* next = nullptr;
    ContextScope scope = ContextScope::Body;

    TableCell const* cell = nullptr;
    std::vector<Paragraph const*> cellParagraphs;
    std::optional<std::size_t> cellParaIndex;
    Table const* parentTable = nullptr;

    BlankLineOptions const* options = nullptr;

    Paragraph const* currentParagraph() const { return current ? current->asParagraph() : nullptr; }
    Paragraph const* prevParagraph() const { return prev ? prev->asParagraph() : nullptr; }
    Paragraph const* nextParagraph() const { return next ? next->asParagraph() : nullptr; }
    Table const* nextTable() const { return next ? next->asTable() : nullptr; }
};

/// @struct Rule
/// @brief A blank-line rule
///
/// @code{.cpp}
/// Rule aboveHeading1{
///     "remove-above-heading1",
///     RuleAction::Remove,
///     RuleScope::Body,
///     [](RuleContext const& ctx) {
///         auto const* next = ctx.nextParagraph();
///         return isBlankParagraph(ctx.current) && next && isHeading1(*next);
///     }
/// };
/// @endcode
struct Rule {
    std::string id;
    RuleAction action = RuleAction::Remove;
    RuleScope scope = RuleScope::Both;

    /// @brief Predicate deciding whether the rule claims the position
    ///
    /// For removal rules: the blank at the current position must go.
    /// For addition rules: a blank must exist next to the current element.
    std::function<bool(RuleContext const&)> matches;

    bool appliesTo(ContextScope where) const;
};

/// @class Rules
/// @brief An ordered, first-match list of rules
class Rules {
public:
    Rules() = default;
    explicit Rules(std::vector<Rule> rules);

    /// @brief Append a rule at the lowest precedence
    void add(Rule rule);

    /// @brief Insert a rule ahead of every existing rule
    void prepend(Rule rule);

    /// @brief Find the first rule whose scope fits the context and that matches it
    /// @return Pointer to the matching rule, or nullptr if none matches
    Rule const* findMatch(RuleContext const& context) const;

    std::size_t size() const { return rules_.size(); }
    void forEach(std::function<void(Rule const&)> fn) const;

private:
    std::vector<Rule> rules_;
};

/// @defgroup context_builders Context Builders
/// @{

/// @brief Context for the body element at @p index
/// @throws std::out_of_range when index >= bodyElementCount()
RuleContext buildBodyContext(Document const& document, std::size_t index,
                             BlankLineOptions const* options = nullptr);

/// @brief Context for paragraph @p paraIndex of @p cell
RuleContext buildCellContext(Document const& document, TableCell const& cell,
                             std::size_t paraIndex, Table const& parentTable,
                             BlankLineOptions const* options = nullptr);

/// @} // end of context_builders

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_RULES_H
