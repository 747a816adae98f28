/// @file indentation.cpp
/// @brief Small-indent removal and list continuation indentation
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "indentation.h"
#include "log.h"
#include "paragraph_checks.h"
#include "text_utils.h"

#include <cmath>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace blankline_cpp {

namespace {

struct PrefixPattern {
    TypedPrefixKind kind;
    std::regex pattern;
};

// Roman numerals (up to xxxix) are tried before letters, so a lone "i."
// or "v." reads as roman.
std::vector<PrefixPattern> const& prefixPatterns() {
    static std::vector<PrefixPattern> const patterns = {
        {TypedPrefixKind::Number, std::regex(R"(^(\(?\d{1,3}[.)])\s+)")},
        {TypedPrefixKind::Roman, std::regex(R"(^(\(?(?=[ivx])x{0,3}(?:ix|iv|v?i{0,3})[.)])\s+)", std::regex::icase)},
        {TypedPrefixKind::Letter, std::regex(R"(^(\(?[a-z][.)])\s+)", std::regex::icase)},
        {TypedPrefixKind::Bullet, std::regex(R"(^((?:\xE2\x80\xA2|\xE2\x97\xA6|\xE2\x96\xAA|\xC2\xB7|-|\*))\s+)")},
    };
    return patterns;
}

// Nearest list item above @p index in @p paragraphs, or null when a
// non-indented text paragraph comes first.
std::optional<int> precedingListLevel(std::vector<Paragraph const*> const& paragraphs, std::size_t index) {
    for (std::size_t i = index; i-- > 0;) {
        Paragraph const* paragraph = paragraphs[i];
        if (!paragraph) return std::nullopt;   // table boundary
        if (isParagraphBlank(*paragraph)) continue;
        if (auto const& numbering = paragraph->numbering()) {
            return numbering->level;
        }
        if (!hasDirectIndent(*paragraph)) return std::nullopt;
    }
    return std::nullopt;
}

bool isIndentedText(Paragraph const* paragraph) {
    return paragraph && !isParagraphBlank(*paragraph) && !isListItem(*paragraph)
        && hasDirectIndent(*paragraph);
}

// Applies both indentation rules to one sequence of paragraphs. Null
// entries stand for tables.
std::size_t alignSequence(std::vector<Paragraph*> const& paragraphs, ListBulletSettings const& settings) {
    std::vector<Paragraph const*> view(paragraphs.begin(), paragraphs.end());
    std::size_t fixed = 0;

    for (std::size_t i = 0; i < paragraphs.size(); ++i) {
        Paragraph* paragraph = paragraphs[i];
        if (!isIndentedText(paragraph)) continue;

        int indent = directLeftIndent(*paragraph);
        std::optional<int> target;
        if (auto level = precedingListLevel(view, i)) {
            target = textIndentForLevel(settings, *level);
        } else if (i > 0 && isIndentedText(paragraphs[i - 1])) {
            target = textIndentForLevel(settings, 0);
        }

        if (target && *target != indent) {
            paragraph->setLeftIndent(*target);
            ++fixed;
        }
    }
    return fixed;
}

std::vector<Paragraph*> bodySequence(Document& document) {
    std::vector<Paragraph*> sequence;
    sequence.reserve(document.bodyElementCount());
    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        sequence.push_back(document.bodyElementAt(i)->asParagraph());
    }
    return sequence;
}

std::size_t removeSmallIndent(Paragraph& paragraph, char const* where) {
    if (isParagraphBlank(paragraph)) return 0;
    int indent = directLeftIndent(paragraph);
    if (indent <= 0 || indent >= kSmallIndentThresholdTwips) return 0;
    if (isListElement(paragraph)) return 0;

    logger("IndentationRules")->debug("Removing small indent ({} twips / {:.2f}\") from {} paragraph: \"{}\"",
                                      indent, static_cast<double>(indent) / kTwipsPerInch, where,
                                      utf8Prefix(paragraph.text(), 40));
    paragraph.setLeftIndent(0);
    return 1;
}

} // namespace

TypedPrefix detectTypedPrefix(std::string_view text) {
    std::string trimmed = trimStr(text);
    for (auto const& candidate : prefixPatterns()) {
        std::smatch match;
        if (std::regex_search(trimmed, match, candidate.pattern)) {
            return TypedPrefix{candidate.kind, match.str(0)};
        }
    }
    return {};
}

bool isListElement(Paragraph const& paragraph) {
    if (auto const& numbering = paragraph.numbering(); numbering && numbering->numId != 0) {
        return true;
    }
    return detectTypedPrefix(paragraph.text()).kind != TypedPrefixKind::None;
}

int inchesToTwips(double inches) {
    return static_cast<int>(std::lround(inches * kTwipsPerInch));
}

std::optional<int> textIndentForLevel(ListBulletSettings const& settings, int level) {
    auto const& levels = settings.indentationLevels;
    if (levels.empty()) return std::nullopt;
    for (auto const& setting : levels) {
        if (setting.level == level) return inchesToTwips(setting.textIndent);
    }
    return inchesToTwips(levels.back().textIndent);
}

std::size_t removeSmallIndents(Document& document) {
    std::size_t fixed = 0;

    for (std::size_t i = 0; i < document.bodyElementCount(); ++i) {
        if (auto* paragraph = document.bodyElementAt(i)->asParagraph()) {
            fixed += removeSmallIndent(*paragraph, "body");
        }
    }

    for (Table* table : document.allTables()) {
        for (auto& row : table->rows()) {
            for (auto& cell : row.cells()) {
                for (Paragraph* paragraph : cell.paragraphs()) {
                    fixed += removeSmallIndent(*paragraph, "table cell");
                }
            }
        }
    }

    if (fixed > 0) {
        logger("IndentationRules")->info("Removed small indentation (< 0.25\") from {} non-list paragraphs", fixed);
    }
    return fixed;
}

std::size_t applyIndentationRules(Document& document, BlankLineOptions const& options) {
    if (!options.listBulletSettings) return 0;
    ListBulletSettings const& settings = *options.listBulletSettings;

    std::size_t fixed = alignSequence(bodySequence(document), settings);

    for (Table* table : document.allTables()) {
        for (auto& row : table->rows()) {
            for (auto& cell : row.cells()) {
                fixed += alignSequence(cell.paragraphs(), settings);
            }
        }
    }

    if (fixed > 0) {
        logger("IndentationRules")->info("Fixed indentation on {} paragraphs", fixed);
    }
    return fixed;
}

} // namespace blankline_cpp
