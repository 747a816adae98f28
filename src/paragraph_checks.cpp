/// @file paragraph_checks.cpp
/// @brief Paragraph, table and cell predicates
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "paragraph_checks.h"
#include "text_utils.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blankline_cpp {

namespace {

bool isRunLike(ContentItem const& item) {
    return item.kind == ContentKind::Run || item.kind == ContentKind::ImageRun;
}

// numId of the nearest list paragraph among @p elements in the given
// direction; tables (null paragraphs) stop the scan.
template<typename Range>
std::optional<int> nearestNumId(Range const& elements) {
    for (Paragraph const* paragraph : elements) {
        if (!paragraph) return std::nullopt;
        if (paragraph->numbering()) return paragraph->numbering()->numId;
    }
    return std::nullopt;
}

bool sameListAround(std::vector<Paragraph const*> const& sequence, std::size_t index) {
    if (index >= sequence.size()) return false;
    Paragraph const* current = sequence[index];
    if (!current || isListItem(*current)) return false;

    std::vector<Paragraph const*> before(sequence.rbegin() + static_cast<std::ptrdiff_t>(sequence.size() - index),
                                         sequence.rend());
    std::vector<Paragraph const*> after(sequence.begin() + static_cast<std::ptrdiff_t>(index + 1), sequence.end());

    auto prevNumId = nearestNumId(before);
    auto nextNumId = nearestNumId(after);
    return prevNumId && nextNumId && *prevNumId == *nextNumId;
}

template<typename Pred>
bool anyHyperlinkText(Paragraph const& paragraph, Pred pred) {
    return std::any_of(paragraph.content().begin(), paragraph.content().end(),
        [&](ContentItem const& item) {
            return item.kind == ContentKind::Hyperlink && pred(toLower(trimStr(item.text)));
        });
}

} // namespace

bool isParagraphBlank(Paragraph const& paragraph) {
    for (auto const& item : paragraph.content()) {
        switch (item.kind) {
            case ContentKind::Hyperlink:
            case ContentKind::ImageRun:
            case ContentKind::Shape:
            case ContentKind::TextBox:
            case ContentKind::Field:
                return false;
            case ContentKind::Revision: {
                if (!isBlankText(item.plainText())) return false;
                bool wrapsHyperlink = std::any_of(item.children.begin(), item.children.end(),
                    [](ContentItem const& child) { return child.kind == ContentKind::Hyperlink; });
                if (wrapsHyperlink) return false;
                break;
            }
            case ContentKind::Run:
                if (!isBlankText(item.text)) return false;
                break;
        }
    }
    return paragraph.bookmarksStart().empty() && paragraph.bookmarksEnd().empty();
}

bool startsWithBoldColon(Paragraph const& paragraph) {
    auto const& content = paragraph.content();
    auto firstRun = std::find_if(content.begin(), content.end(), isRunLike);
    if (firstRun == content.end() || !firstRun->formatting.bold) return false;

    std::string text = paragraph.text();
    if (text.empty()) return false;
    return utf8Prefix(text, kBoldColonWindow).find(':') != std::string::npos;
}

bool isCenteredBoldText(Paragraph const& paragraph) {
    if (paragraph.alignment() != Alignment::Center) return false;

    bool hasTextRun = false;
    for (auto const& item : paragraph.content()) {
        if (item.kind != ContentKind::Run || isBlankText(item.text)) continue;
        if (!item.formatting.bold) return false;
        hasTextRun = true;
    }
    return hasTextRun;
}

bool isTextOnlyParagraph(Paragraph const& paragraph) {
    if (isParagraphBlank(paragraph)) return false;
    bool hasMedia = std::any_of(paragraph.content().begin(), paragraph.content().end(),
        [](ContentItem const& item) {
            return item.kind == ContentKind::ImageRun
                || item.kind == ContentKind::Shape
                || item.kind == ContentKind::TextBox;
        });
    return !hasMedia && !isBlankText(paragraph.text());
}

bool isTocParagraph(Paragraph const& paragraph) {
    return startsWith(toLower(paragraph.style()), "toc");
}

bool isHeading1(Paragraph const& paragraph) {
    return paragraph.style() == "Heading1" && !isBlankText(paragraph.text());
}

bool isListItem(Paragraph const& paragraph) {
    return paragraph.numbering().has_value();
}

int directLeftIndent(Paragraph const& paragraph) {
    return paragraph.formatting().leftIndent.value_or(0);
}

bool hasDirectIndent(Paragraph const& paragraph) {
    return directLeftIndent(paragraph) > 0;
}

int effectiveLeftIndent(Paragraph const& paragraph, Document const& document) {
    int direct = directLeftIndent(paragraph);
    if (direct > 0) return direct;

    if (paragraph.style().empty()) return 0;
    StyleDefinition const* style = document.style(paragraph.style());
    if (!style) return 0;

    int inherited = style->leftIndent.value_or(0);
    if (inherited > 0) return inherited;

    if (style->hasIndentation && style->id == kListParagraphStyle) {
        return kListParagraphFallbackIndent;
    }
    return 0;
}

bool hasNavigationHyperlink(Paragraph const& paragraph) {
    return anyHyperlinkText(paragraph, [](std::string const& text) {
        return startsWith(text, "top of") || startsWith(text, "return to");
    });
}

bool hasTopOfDocumentHyperlink(Paragraph const& paragraph) {
    return anyHyperlinkText(paragraph, [](std::string const& text) {
        return text == "top of document" || text == "top of the document";
    });
}

bool isDisclaimerParagraph(Paragraph const& paragraph) {
    static constexpr auto kFragments = std::to_array<std::string_view>({
        "not to be reproduced",
        "electronic data",
        "paper copy = informational only"
    });
    std::string text = toLower(trimStr(paragraph.text()));
    if (text.empty()) return false;
    return std::any_of(kFragments.begin(), kFragments.end(), [&](std::string_view fragment) {
        return text.find(fragment) != std::string::npos;
    });
}

bool isBlankParagraph(Element const* element) {
    if (!element) return false;
    auto const* paragraph = element->asParagraph();
    return paragraph && isParagraphBlank(*paragraph);
}

bool isListParagraph(Element const* element) {
    if (!element) return false;
    auto const* paragraph = element->asParagraph();
    return paragraph && isListItem(*paragraph);
}

bool tableHasNestedContent(Table const& table) {
    return std::any_of(table.rows().begin(), table.rows().end(), [](TableRow const& row) {
        return std::any_of(row.cells().begin(), row.cells().end(), [](TableCell const& cell) {
            return cell.hasNestedTables();
        });
    });
}

std::string firstCellText(Table const& table) {
    TableCell const* cell = table.cellAt(0, 0);
    return cell ? cell->text() : std::string{};
}

bool isWithinListContext(Document const& document, std::size_t index) {
    std::vector<Paragraph const*> sequence;
    sequence.reserve(document.bodyElementCount());
    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        sequence.push_back(document.bodyElementAt(i)->asParagraph());
    }
    return sameListAround(sequence, index);
}

bool isWithinListContextInCell(TableCell const& cell, std::size_t paraIndex) {
    return sameListAround(cell.paragraphs(), paraIndex);
}

} // namespace blankline_cpp
