/// @file removal_rules.cpp
/// @brief Rules deciding when a blank paragraph must be removed
///
/// Every rule here first requires the current element to be a blank
/// paragraph; a match means the blank is deleted no matter what the
/// addition rules or the original document say.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "blank_line_rules.h"
#include "image_checks.h"
#include "paragraph_checks.h"

#include <cstddef>
#include <string>
#include <vector>

namespace blankline_cpp {

namespace {

bool currentIsBlank(RuleContext const& ctx) {
    return isBlankParagraph(ctx.current);
}

// Indented or list content that a preceding list item governs. An
// indented small image counts through its indentation.
bool isListContinuation(Paragraph const& next, Document const& document) {
    return isListItem(next) || effectiveLeftIndent(next, document) > 0;
}

Rule aboveHeading1Rule() {
    return Rule{
        std::string(rule_ids::kRemoveAboveHeading1),
        RuleAction::Remove,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body || !currentIsBlank(ctx)) return false;
            auto const* next = ctx.nextParagraph();
            return next && isHeading1(*next);
        }
    };
}

// Only multi-row tables; a single-row table may use a leading blank as padding.
Rule firstLineOfMultiRowCellRule() {
    return Rule{
        std::string(rule_ids::kRemoveFirstLineMultiRowCell),
        RuleAction::Remove,
        RuleScope::Cell,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Cell) return false;
            if (ctx.cellParaIndex != std::size_t{0} || ctx.cellParagraphs.empty()) return false;
            if (!currentIsBlank(ctx)) return false;
            return ctx.parentTable && ctx.parentTable->rowCount() > 1;
        }
    };
}

Rule aboveLargeTableRule() {
    return Rule{
        std::string(rule_ids::kRemoveAboveLargeTable),
        RuleAction::Remove,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body || !currentIsBlank(ctx)) return false;
            auto const* table = ctx.nextTable();
            return table && table->isLargerThan1x1();
        }
    };
}

Rule betweenListItemsRule() {
    return Rule{
        std::string(rule_ids::kRemoveBetweenListItems),
        RuleAction::Remove,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            if (!currentIsBlank(ctx)) return false;
            return isListParagraph(ctx.prev) && isListParagraph(ctx.next);
        }
    };
}

Rule listItemToIndentedContentRule() {
    return Rule{
        std::string(rule_ids::kRemoveListToIndented),
        RuleAction::Remove,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            if (!currentIsBlank(ctx) || !isListParagraph(ctx.prev)) return false;
            auto const* next = ctx.nextParagraph();
            return next && isListContinuation(*next, *ctx.document);
        }
    };
}

Rule beforeFirstListItemRule() {
    return Rule{
        std::string(rule_ids::kRemoveBeforeFirstListItem),
        RuleAction::Remove,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            if (!currentIsBlank(ctx) || !isListParagraph(ctx.next)) return false;
            auto const* prev = ctx.prevParagraph();
            if (!prev || isListItem(*prev) || isParagraphBlank(*prev)) return false;
            return !hasDirectIndent(*prev);
        }
    };
}

Rule boldColonToIndentedRule() {
    return Rule{
        std::string(rule_ids::kRemoveBoldColonToIndented),
        RuleAction::Remove,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            if (!currentIsBlank(ctx)) return false;
            auto const* prev = ctx.prevParagraph();
            if (!prev || !startsWithBoldColon(*prev) || hasDirectIndent(*prev)) return false;
            auto const* next = ctx.nextParagraph();
            return next && (isListItem(*next) || hasDirectIndent(*next));
        }
    };
}

Rule afterTopOfDocHyperlinkRule() {
    return Rule{
        std::string(rule_ids::kRemoveAfterTopOfDocHyperlink),
        RuleAction::Remove,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body || !currentIsBlank(ctx)) return false;
            auto const* prev = ctx.prevParagraph();
            return prev && hasTopOfDocumentHyperlink(*prev);
        }
    };
}

// Cells holding nested tables keep their trailing blanks; the blank may be
// what separates the nested table from the cell end.
Rule lastLineInCellRule() {
    return Rule{
        std::string(rule_ids::kRemoveLastLineInCell),
        RuleAction::Remove,
        RuleScope::Cell,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Cell || !ctx.cell || !ctx.cellParaIndex) return false;
            if (!currentIsBlank(ctx)) return false;

            auto const& paragraphs = ctx.cellParagraphs;
            std::size_t count = paragraphs.size();
            std::size_t index = *ctx.cellParaIndex;

            if (count > 1 && index == count - 1) {
                return !ctx.cell->hasNestedTables();
            }
            if (count >= 2 && index >= 1 && index == count - 2
                && isParagraphBlank(*paragraphs[count - 1])) {
                return !ctx.cell->hasNestedTables();
            }
            return false;
        }
    };
}

Rule largeImageLastInCellRule() {
    return Rule{
        std::string(rule_ids::kRemoveLargeImageLastInCell),
        RuleAction::Remove,
        RuleScope::Cell,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Cell || !ctx.cell || !ctx.cellParaIndex) return false;
            if (!currentIsBlank(ctx)) return false;

            auto const& paragraphs = ctx.cellParagraphs;
            std::size_t index = *ctx.cellParaIndex;
            if (index < 1 || index - 1 >= paragraphs.size()) return false;
            if (!hasLargeImage(*paragraphs[index - 1])) return false;

            for (std::size_t i = index + 1; i < paragraphs.size(); ++i) {
                if (!isParagraphBlank(*paragraphs[i])) return false;
            }
            return true;
        }
    };
}

} // namespace

Rules builtinRemovalRules() {
    return Rules({
        aboveHeading1Rule(),
        firstLineOfMultiRowCellRule(),
        aboveLargeTableRule(),
        betweenListItemsRule(),
        listItemToIndentedContentRule(),
        beforeFirstListItemRule(),
        boldColonToIndentedRule(),
        afterTopOfDocHyperlinkRule(),
        lastLineInCellRule(),
        largeImageLastInCellRule(),
    });
}

} // namespace blankline_cpp
