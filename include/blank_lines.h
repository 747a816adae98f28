/// @file blank_lines.h
/// @brief Blank-line rule engine and its options
///
/// BlankLineManager is the entry point that normalizes blank separator
/// paragraphs in a Document. It runs a fixed pipeline over the body and
/// over every table cell:
///
/// -# Removal rules (walk backwards, delete blanks a rule forbids)
/// -# Addition rules (walk forwards, insert blanks a rule requires)
/// -# Preservation fallback (reinsert blanks the snapshot remembers and no
///    removal rule forbids)
/// -# Indentation rules for list continuation text
/// -# Deduplication of adjacent blanks and trailing cell blanks, followed
///    by one more removal pass over the blanks that survive
/// -# Style normalization of every surviving blank
///
/// The snapshot must be captured from the unmodified document with
/// captureBlankLineSnapshot() before anything else touches it.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_BLANK_LINES_H
#define BLANKLINE_CPP_BLANK_LINES_H

#include "document.h"
#include "rules.h"
#include "snapshot.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blankline_cpp {

/// @struct ListLevelSetting
/// @brief Bullet and text indentation of one list level, in inches
struct ListLevelSetting {
    int level = 0;
    double symbolIndent = 0.0;
    double textIndent = 0.0;
};

/// @struct ListBulletSettings
struct ListBulletSettings {
    std::vector<ListLevelSetting> indentationLevels;
};

/// @struct NormalStyleFormatting
/// @brief Formatting applied to every blank paragraph
///
/// Spacing values are in twips, font size in points.
struct NormalStyleFormatting {
    std::optional<int> spaceBefore;
    int spaceAfter = 120;
    std::optional<int> lineSpacing;
    std::optional<double> fontSize;
    std::optional<std::string> fontFamily;
};

/// @struct BlankLineOptions
/// @brief Configuration of the blank-line engine
///
/// @code{.cpp}
/// BlankLineOptions options;
/// options.listBulletSettings = ListBulletSettings{{{0, 0.25, 0.50}, {1, 0.75, 1.00}}};
/// options.normalStyleFormatting.spaceAfter = 0;
/// BlankLineManager manager(options);
/// @endcode
struct BlankLineOptions {
    /// @brief Text indentation per list level used by the indentation rules
    ///
    /// When unset the indentation rules do nothing.
    std::optional<ListBulletSettings> listBulletSettings;

    NormalStyleFormatting normalStyleFormatting;

    /// @brief Heading text that switches off the "blank after bold label" rule
    ///
    /// Once a 1x1 table whose text contains this heading has appeared earlier
    /// in the body, bold-colon paragraphs below it no longer get a blank
    /// after them.
    std::optional<std::string> stopBoldColonAfterHeading;

    /// @brief Style id given to every blank paragraph
    std::string blankStyle;

    /// @brief Mark created blanks as preserved so later host passes skip them
    bool markAsPreserved;

    /// @brief Constructor that sets default option values
    BlankLineOptions();
};

/// @struct RuleEngineResult
/// @brief Mutation counts of one engine run
struct RuleEngineResult {
    std::size_t removed = 0;
    std::size_t added = 0;
    std::size_t preserved = 0;
    std::size_t indentationFixed = 0;
};

/// @class BlankLineManager
/// @brief Runs the blank-line pipeline over a document
///
/// @par Basic Usage
/// @code{.cpp}
/// removeSmallIndents(doc);
/// auto snapshot = captureBlankLineSnapshot(doc);
/// BlankLineManager manager;
/// RuleEngineResult result = manager.processBlankLines(doc, snapshot);
/// @endcode
///
/// @par With Custom Rules
/// @code{.cpp}
/// BlankLineManager manager;
/// manager.addRule({"remove-above-heading2", RuleAction::Remove, RuleScope::Body,
///     [](RuleContext const& ctx) {
///         auto const* next = ctx.nextParagraph();
///         return isBlankParagraph(ctx.current) && next && next->style() == "Heading2";
///     }});
/// @endcode
class BlankLineManager {
public:
    /// @brief Construct a manager with default options
    BlankLineManager();

    /// @brief Construct a manager with custom options
    explicit BlankLineManager(BlankLineOptions options);

    /// @brief Configure options using a callback function
    /// @return Reference to this manager for chaining
    BlankLineManager& configureOptions(std::function<void(BlankLineOptions&)> fn);

    BlankLineOptions const& options() const { return options_; }

    /// @brief Add a rule ahead of the built-in rules of the same action
    /// @return Reference to this manager for chaining
    BlankLineManager& addRule(Rule rule);

    Rules const& removalRules() const { return removalRules_; }
    Rules const& additionRules() const { return additionRules_; }

    /// @brief Run the whole pipeline
    ///
    /// @param[in,out] document The document, mutated in place
    /// @param[in]     snapshot Blank positions of the unmodified document
    /// @return Counts of removed, added and preserved blanks and of
    ///         indentation changes
    RuleEngineResult processBlankLines(Document& document, BlankLineSnapshot const& snapshot) const;

private:
    std::size_t applyRemovalRulesBody(Document& document) const;
    std::size_t applyRemovalRulesCells(Document& document) const;
    std::size_t applyAdditionRulesBody(Document& document) const;
    std::size_t applyAdditionRulesCells(Document& document) const;
    std::size_t applyPreservationFallbackBody(Document& document, BlankLineSnapshot const& snapshot) const;
    std::size_t applyPreservationFallbackCells(Document& document, BlankLineSnapshot const& snapshot) const;

    /// @brief Removal rule that would delete a blank inserted at @p blankIndex
    Rule const* findRemovalForBodySlot(Document const& document, std::size_t blankIndex) const;

    /// @brief Removal rule that would delete a blank inserted before paragraph @p blankIndex of a cell
    Rule const* findRemovalForCellSlot(Document const& document, TableCell const& cell,
                                       std::size_t blankIndex, Table const& table) const;

    std::size_t dedup(Document& document) const;
    void normalizeBlankLineStyles(Document& document) const;

    BlankLineOptions options_;
    Rules removalRules_;
    Rules additionRules_;
};

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_BLANK_LINES_H
