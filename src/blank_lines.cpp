/// @file blank_lines.cpp
/// @brief Implementation of the blank-line rule engine
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "blank_lines.h"
#include "blank_line_rules.h"
#include "cleanup.h"
#include "image_checks.h"
#include "indentation.h"
#include "log.h"
#include "paragraph_checks.h"
#include "text_utils.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace blankline_cpp {

namespace {

std::shared_ptr<spdlog::logger> const& engineLog() {
    static auto const instance = logger("BlankLineManager");
    return instance;
}

bool isBlankAt(Document const& document, std::size_t index) {
    return index < document.bodyElementCount() && isBlankParagraph(document.bodyElementAt(index));
}

bool isBlankInCell(TableCell const& cell, std::size_t index) {
    Paragraph const* paragraph = index < cell.paragraphCount() ? cell.paragraphAt(index) : nullptr;
    return paragraph && isParagraphBlank(*paragraph);
}

// A caption directly above an image keeps the image tight against it.
bool isCenteredCaption(Element const* element) {
    auto const* paragraph = element ? element->asParagraph() : nullptr;
    return paragraph && paragraph->alignment() == Alignment::Center
        && !trimStr(paragraph->text()).empty();
}

void insertBlankInBody(Document& document, std::size_t index, BlankLineOptions const& options) {
    document.insertBodyElementAt(index, std::make_unique<Paragraph>(createBlankParagraph(options)));
}

void applyBlankFormatting(Paragraph& blank, BlankLineOptions const& options) {
    auto const& formatting = options.normalStyleFormatting;

    blank.setStyle(options.blankStyle);
    blank.setSpaceAfter(formatting.spaceAfter);
    if (formatting.spaceBefore) blank.setSpaceBefore(*formatting.spaceBefore);
    if (formatting.lineSpacing) blank.setLineSpacing(*formatting.lineSpacing);

    auto applyFont = [&](RunFormatting& run) {
        if (formatting.fontSize) run.fontSize = formatting.fontSize;
        if (formatting.fontFamily) run.fontFamily = formatting.fontFamily;
    };
    for (auto& item : blank.content()) {
        if (item.kind == ContentKind::Run) applyFont(item.formatting);
    }
    applyFont(blank.markFormatting());
}

template<typename Fn>
void forEachEditableCell(Document& document, Fn fn) {
    for (Table* table : document.allTables()) {
        if (tableHasNestedContent(*table)) continue;
        for (auto& row : table->rows()) {
            for (auto& cell : row.cells()) {
                fn(*table, cell);
            }
        }
    }
}

} // namespace

BlankLineOptions::BlankLineOptions()
    : blankStyle("Normal"),
      markAsPreserved(true) {}

BlankLineManager::BlankLineManager()
    : removalRules_(builtinRemovalRules()),
      additionRules_(builtinAdditionRules()) {}

BlankLineManager::BlankLineManager(BlankLineOptions options)
    : options_(std::move(options)),
      removalRules_(builtinRemovalRules()),
      additionRules_(builtinAdditionRules()) {}

BlankLineManager& BlankLineManager::configureOptions(std::function<void(BlankLineOptions&)> fn) {
    fn(options_);
    return *this;
}

BlankLineManager& BlankLineManager::addRule(Rule rule) {
    if (rule.action == RuleAction::Remove) {
        removalRules_.prepend(std::move(rule));
    } else {
        additionRules_.prepend(std::move(rule));
    }
    return *this;
}

RuleEngineResult BlankLineManager::processBlankLines(Document& document, BlankLineSnapshot const& snapshot) const {
    RuleEngineResult result;

    result.removed += applyRemovalRulesBody(document);
    result.removed += applyRemovalRulesCells(document);

    result.added += applyAdditionRulesBody(document);
    result.added += applyAdditionRulesCells(document);

    result.preserved += applyPreservationFallbackBody(document, snapshot);
    result.preserved += applyPreservationFallbackCells(document, snapshot);

    result.indentationFixed = applyIndentationRules(document, options_);

    result.removed += dedup(document);

    // Collapsing a run of blanks can leave one between neighbours that a
    // removal rule forbids.
    result.removed += applyRemovalRulesBody(document);
    result.removed += applyRemovalRulesCells(document);

    normalizeBlankLineStyles(document);

    engineLog()->info("Rule engine complete: {} removed, {} added, {} preserved, {} indentation fixes",
                      result.removed, result.added, result.preserved, result.indentationFixed);
    return result;
}

std::size_t BlankLineManager::applyRemovalRulesBody(Document& document) const {
    std::size_t removed = 0;

    for (std::size_t i = document.bodyElementCount(); i-- > 0;) {
        auto const* paragraph = document.bodyElementAt(i)->asParagraph();
        if (!paragraph || !isParagraphBlank(*paragraph)) continue;
        if (paragraph->isPreserved()) continue;

        RuleContext context = buildBodyContext(document, i, &options_);
        if (Rule const* rule = removalRules_.findMatch(context)) {
            engineLog()->debug("Removal rule \"{}\" matched at body index {}", rule->id, i);
            document.removeBodyElementAt(i);
            ++removed;
        }
    }
    return removed;
}

std::size_t BlankLineManager::applyRemovalRulesCells(Document& document) const {
    std::size_t removed = 0;

    forEachEditableCell(document, [&](Table const& table, TableCell& cell) {
        for (std::size_t ci = cell.paragraphCount(); ci-- > 0;) {
            // A cell keeps at least one paragraph.
            if (cell.paragraphCount() <= 1) break;

            Paragraph const* paragraph = cell.paragraphAt(ci);
            if (!isParagraphBlank(*paragraph) || paragraph->isPreserved()) continue;

            RuleContext context = buildCellContext(document, cell, ci, table, &options_);
            if (Rule const* rule = removalRules_.findMatch(context)) {
                engineLog()->debug("Removal rule \"{}\" matched in cell at index {}", rule->id, ci);
                cell.removeParagraphAt(ci);
                ++removed;
            }
        }
    });
    return removed;
}

std::size_t BlankLineManager::applyAdditionRulesBody(Document& document) const {
    std::size_t added = 0;

    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        std::size_t const elementIndex = i;
        Element const* element = document.bodyElementAt(i);

        RuleContext context = buildBodyContext(document, i, &options_);
        if (Rule const* rule = additionRules_.findMatch(context)) {
            engineLog()->debug("Addition rule \"{}\" matched at body index {}", rule->id, i);

            if (rule->id == rule_ids::kAddAboveTopOfDocHyperlink) {
                Paragraph* target = i + 1 < document.bodyElementCount()
                    ? document.bodyElementAt(i + 1)->asParagraph() : nullptr;
                if (target && hasDirectIndent(*target)) target->setLeftIndent(0);
            }

            if (insertsBeforeNext(*rule)) {
                // A blank current element already separates it from the next.
                if (i + 1 < document.bodyElementCount() && !isBlankAt(document, i + 1)
                    && !isBlankParagraph(element)) {
                    insertBlankInBody(document, i + 1, options_);
                    ++added;
                    ++i;
                }
            } else if (!isBlankAt(document, i + 1)) {
                insertBlankInBody(document, i + 1, options_);
                ++added;
                ++i;
            }
        }

        // Large images also want a blank above, unless a caption sits there.
        auto const* paragraph = element->asParagraph();
        if (paragraph && !isParagraphBlank(*paragraph) && hasLargeImage(*paragraph) && elementIndex > 0) {
            Element const* prev = document.bodyElementAt(elementIndex - 1);
            if (!isBlankParagraph(prev) && !isCenteredCaption(prev)) {
                engineLog()->debug("Adding blank above large image at body index {}", elementIndex);
                insertBlankInBody(document, elementIndex, options_);
                ++added;
                ++i;
            }
        }
    }
    return added;
}

std::size_t BlankLineManager::applyAdditionRulesCells(Document& document) const {
    std::size_t added = 0;

    forEachEditableCell(document, [&](Table const& table, TableCell& cell) {
        for (std::size_t ci = 0; ci < cell.paragraphCount(); ++ci) {
            RuleContext context = buildCellContext(document, cell, ci, table, &options_);
            Rule const* rule = additionRules_.findMatch(context);
            if (!rule) continue;

            // Never append past the last paragraph of a cell.
            if (ci + 1 >= cell.paragraphCount()) continue;
            if (isBlankInCell(cell, ci + 1)) continue;
            // A blank current paragraph already separates it from the next.
            if (insertsBeforeNext(*rule) && isBlankInCell(cell, ci)) continue;

            engineLog()->debug("Addition rule \"{}\" matched in cell at index {}", rule->id, ci);
            cell.insertParagraphAt(ci + 1, createBlankParagraph(options_));
            ++added;
            ++ci;
        }
    });
    return added;
}

std::size_t BlankLineManager::applyPreservationFallbackBody(Document& document,
                                                            BlankLineSnapshot const& snapshot) const {
    std::size_t preserved = 0;

    for (std::size_t i = 0; i + 1 < document.bodyElementCount(); ++i) {
        if (isBlankAt(document, i + 1)) continue;
        if (!wasOriginallyBlankAtBody(snapshot, document, i + 1)) continue;

        if (Rule const* rule = findRemovalForBodySlot(document, i + 1)) {
            engineLog()->debug("Preservation at body index {} overridden by \"{}\"", i + 1, rule->id);
            continue;
        }

        insertBlankInBody(document, i + 1, options_);
        ++preserved;
        ++i;
    }
    return preserved;
}

std::size_t BlankLineManager::applyPreservationFallbackCells(Document& document,
                                                             BlankLineSnapshot const& snapshot) const {
    std::size_t preserved = 0;
    std::size_t tableIndex = 0;

    // Every table advances tableIndex, so cell ids line up with the snapshot.
    for (Table* table : document.allTables()) {
        std::size_t const ti = tableIndex++;
        if (tableHasNestedContent(*table)) continue;

        // Blanks added to the first cell change its text, so use the key
        // recorded before any mutation.
        std::string const firstText = ti < snapshot.tableKeys.size()
            ? snapshot.tableKeys[ti] : firstCellText(*table);
        auto& rows = table->rows();
        for (std::size_t ri = 0; ri < rows.size(); ++ri) {
            auto& cells = rows[ri].cells();
            for (std::size_t column = 0; column < cells.size(); ++column) {
                TableCell& cell = cells[column];
                std::string const cellId = makeCellId(ti, ri, column, firstText);

                for (std::size_t ci = 0; ci + 1 < cell.paragraphCount(); ++ci) {
                    if (isBlankInCell(cell, ci + 1)) continue;
                    if (!wasOriginallyBlankInCell(snapshot, cell, ci + 1, cellId)) continue;
                    // Nothing is restored directly above the last paragraph.
                    if (ci + 2 >= cell.paragraphCount()) continue;
                    if (findRemovalForCellSlot(document, cell, ci + 1, *table)) continue;

                    cell.insertParagraphAt(ci + 1, createBlankParagraph(options_));
                    ++preserved;
                    ++ci;
                }
            }
        }
    }
    return preserved;
}

Rule const* BlankLineManager::findRemovalForBodySlot(Document const& document, std::size_t blankIndex) const {
    Paragraph const candidate{};

    RuleContext context;
    context.document = &document;
    context.currentIndex = blankIndex;
    context.current = &candidate;
    context.prev = blankIndex > 0 ? document.bodyElementAt(blankIndex - 1) : nullptr;
    context.next = blankIndex < document.bodyElementCount() ? document.bodyElementAt(blankIndex) : nullptr;
    context.scope = ContextScope::Body;
    context.options = &options_;
    return removalRules_.findMatch(context);
}

Rule const* BlankLineManager::findRemovalForCellSlot(Document const& document, TableCell const& cell,
                                                     std::size_t blankIndex, Table const& table) const {
    Paragraph const candidate{};

    RuleContext context;
    context.document = &document;
    context.currentIndex = blankIndex;
    context.scope = ContextScope::Cell;
    context.cell = &cell;
    context.cellParagraphs = cell.paragraphs();
    context.cellParagraphs.insert(context.cellParagraphs.begin() + static_cast<std::ptrdiff_t>(blankIndex),
                                  &candidate);
    context.cellParaIndex = blankIndex;
    context.parentTable = &table;
    context.options = &options_;

    context.current = &candidate;
    context.prev = blankIndex > 0 ? context.cellParagraphs[blankIndex - 1] : nullptr;
    context.next = blankIndex + 1 < context.cellParagraphs.size() ? context.cellParagraphs[blankIndex + 1] : nullptr;
    return removalRules_.findMatch(context);
}

std::size_t BlankLineManager::dedup(Document& document) const {
    std::size_t removed = 0;

    for (std::size_t i = document.bodyElementCount(); i-- > 1;) {
        if (isBlankAt(document, i) && isBlankAt(document, i - 1)) {
            document.removeBodyElementAt(i);
            ++removed;
        }
    }

    forEachEditableCell(document, [&](Table const&, TableCell& cell) {
        for (std::size_t ci = cell.paragraphCount(); ci-- > 1;) {
            if (cell.paragraphCount() <= 1) break;
            if (isBlankInCell(cell, ci) && isBlankInCell(cell, ci - 1)) {
                cell.removeParagraphAt(ci);
                ++removed;
            }
        }
        while (cell.paragraphCount() > 1 && isBlankInCell(cell, cell.paragraphCount() - 1)) {
            cell.removeParagraphAt(cell.paragraphCount() - 1);
            ++removed;
        }
    });

    if (removed > 0) {
        engineLog()->debug("Dedup removed {} adjacent blank paragraphs", removed);
    }
    return removed;
}

void BlankLineManager::normalizeBlankLineStyles(Document& document) const {
    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        auto* paragraph = document.bodyElementAt(i)->asParagraph();
        if (paragraph && isParagraphBlank(*paragraph)) applyBlankFormatting(*paragraph, options_);
    }

    for (Table* table : document.allTables()) {
        for (auto& row : table->rows()) {
            for (auto& cell : row.cells()) {
                for (Paragraph* paragraph : cell.paragraphs()) {
                    if (isParagraphBlank(*paragraph)) applyBlankFormatting(*paragraph, options_);
                }
            }
        }
    }
}

} // namespace blankline_cpp
