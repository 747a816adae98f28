/// @file addition_rules.cpp
/// @brief Rules deciding where a blank paragraph must exist
///
/// An addition rule looks at the current element and its neighbours and
/// asks for a blank either after the current element or, for the rules
/// listed in insertsBeforeNext(), above the next one. The engine decides
/// whether a blank is already there.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "blank_line_rules.h"
#include "blank_lines.h"
#include "image_checks.h"
#include "paragraph_checks.h"
#include "text_utils.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace blankline_cpp {

namespace {

bool isOneByOneTableAt(Document const& document, std::size_t index) {
    auto const* table = document.bodyElementAt(index)->asTable();
    return table && table->is1x1();
}

// A non-list, non-indented paragraph opening with a bold label.
bool isPlainBoldColon(Paragraph const& paragraph) {
    return !isParagraphBlank(paragraph)
        && startsWithBoldColon(paragraph)
        && !isListItem(paragraph)
        && !hasDirectIndent(paragraph);
}

bool relatedDocumentTableNearby(Document const& document, std::size_t index) {
    std::size_t limit = index > kRelatedDocumentLookback ? index - kRelatedDocumentLookback : 0;
    for (std::size_t i = index; i-- > limit;) {
        if (!isOneByOneTableAt(document, i)) continue;
        if (containsIgnoreCase(firstCellText(*document.bodyElementAt(i)->asTable()), "related document")) {
            return true;
        }
    }
    return false;
}

bool stopHeadingSeen(Document const& document, std::size_t index, std::string const& heading) {
    for (std::size_t i = 0; i < index; ++i) {
        if (!isOneByOneTableAt(document, i)) continue;
        if (containsIgnoreCase(firstCellText(*document.bodyElementAt(i)->asTable()), heading)) {
            return true;
        }
    }
    return false;
}

Rule afterHeading1Rule() {
    return Rule{
        std::string(rule_ids::kAddAfterHeading1),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body) return false;
            auto const* current = ctx.currentParagraph();
            return current && isHeading1(*current);
        }
    };
}

// Fires on the last entry of a run of TOC paragraphs.
Rule afterTocRule() {
    return Rule{
        std::string(rule_ids::kAddAfterToc),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body) return false;
            auto const* current = ctx.currentParagraph();
            if (!current || !isTocParagraph(*current)) return false;
            auto const* next = ctx.nextParagraph();
            return !(next && isTocParagraph(*next));
        }
    };
}

Rule beforeFirst1x1TableRule() {
    return Rule{
        std::string(rule_ids::kAddBeforeFirst1x1Table),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body || !ctx.currentParagraph()) return false;
            auto const* table = ctx.nextTable();
            if (!table || !table->is1x1()) return false;
            for (std::size_t i = 0; i < ctx.currentIndex; ++i) {
                if (isOneByOneTableAt(*ctx.document, i)) return false;
            }
            return true;
        }
    };
}

Rule after1x1TablesRule() {
    return Rule{
        std::string(rule_ids::kAddAfter1x1Tables),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body || !ctx.current) return false;
            auto const* table = ctx.current->asTable();
            return table && table->is1x1();
        }
    };
}

Rule afterLargeTablesRule() {
    return Rule{
        std::string(rule_ids::kAddAfterLargeTables),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body || !ctx.current) return false;
            auto const* table = ctx.current->asTable();
            return table && table->isLargerThan1x1();
        }
    };
}

Rule aboveBoldColonNoIndentRule() {
    return Rule{
        std::string(rule_ids::kAddAboveBoldColonNoIndent),
        RuleAction::Add,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            auto const* next = ctx.nextParagraph();
            return next && isPlainBoldColon(*next);
        }
    };
}

Rule boldColonNoIndentAfterRule() {
    return Rule{
        std::string(rule_ids::kAddAfterBoldColonNoIndent),
        RuleAction::Add,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            auto const* current = ctx.currentParagraph();
            if (!current || !isPlainBoldColon(*current)) return false;

            if (auto const* next = ctx.nextParagraph()) {
                if (isListItem(*next) || hasDirectIndent(*next)) return false;
            }

            if (ctx.scope != ContextScope::Body) return true;

            if (relatedDocumentTableNearby(*ctx.document, ctx.currentIndex)) return false;

            if (ctx.options && ctx.options->stopBoldColonAfterHeading
                && !ctx.options->stopBoldColonAfterHeading->empty()
                && stopHeadingSeen(*ctx.document, ctx.currentIndex, *ctx.options->stopBoldColonAfterHeading)) {
                return false;
            }
            return true;
        }
    };
}

Rule aboveTopOfDocHyperlinkRule() {
    return Rule{
        std::string(rule_ids::kAddAboveTopOfDocHyperlink),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body) return false;
            auto const* next = ctx.nextParagraph();
            return next && hasNavigationHyperlink(*next);
        }
    };
}

// A list item wants a blank below it unless the list or its indented
// continuation carries on. A centered image below always gets one.
Rule afterListItemsRule() {
    return Rule{
        std::string(rule_ids::kAddAfterListItems),
        RuleAction::Add,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            if (!isListParagraph(ctx.current)) return false;

            auto const* next = ctx.nextParagraph();
            if (!next) return true;
            if (isListItem(*next)) return false;
            if (next->alignment() == Alignment::Center && firstImageIn(*next)) return true;
            return effectiveLeftIndent(*next, *ctx.document) <= 0;
        }
    };
}

Rule aroundLargeImagesRule() {
    return Rule{
        std::string(rule_ids::kAddAroundLargeImages),
        RuleAction::Add,
        RuleScope::Both,
        [](RuleContext const& ctx) {
            auto const* current = ctx.currentParagraph();
            return current && !isParagraphBlank(*current) && hasLargeImage(*current);
        }
    };
}

Rule aboveWarningRule() {
    return Rule{
        std::string(rule_ids::kAddAboveWarning),
        RuleAction::Add,
        RuleScope::Body,
        [](RuleContext const& ctx) {
            if (ctx.scope != ContextScope::Body) return false;
            auto const* next = ctx.nextParagraph();
            return next && isDisclaimerParagraph(*next);
        }
    };
}

} // namespace

Rules builtinAdditionRules() {
    return Rules({
        afterHeading1Rule(),
        afterTocRule(),
        beforeFirst1x1TableRule(),
        after1x1TablesRule(),
        afterLargeTablesRule(),
        aboveBoldColonNoIndentRule(),
        boldColonNoIndentAfterRule(),
        aboveTopOfDocHyperlinkRule(),
        afterListItemsRule(),
        aroundLargeImagesRule(),
        aboveWarningRule(),
    });
}

bool insertsBeforeNext(Rule const& rule) {
    static constexpr auto kBeforeRules = std::to_array<std::string_view>({
        rule_ids::kAddAboveTopOfDocHyperlink,
        rule_ids::kAddAboveWarning,
        rule_ids::kAddBeforeFirst1x1Table,
        rule_ids::kAddAboveBoldColonNoIndent
    });
    return std::find(kBeforeRules.begin(), kBeforeRules.end(), rule.id) != kBeforeRules.end();
}

} // namespace blankline_cpp
