/// @file indentation.h
/// @brief Indentation normalization around lists
///
/// Two passes run on either side of the blank-line rules:
///
/// - removeSmallIndents() runs first and zeroes trivial (< 0.25") left
///   indentation on non-list text so the rules do not mistake it for
///   intentional structure.
/// - applyIndentationRules() runs after the rules and aligns indented
///   continuation text with the text indent of the governing list level.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_INDENTATION_H
#define BLANKLINE_CPP_INDENTATION_H

#include "blank_lines.h"
#include "document.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace blankline_cpp {

inline constexpr int kTwipsPerInch = 1440;

/// Left indentation below this is removed from non-list paragraphs (0.25").
inline constexpr int kSmallIndentThresholdTwips = 360;

/// @enum TypedPrefixKind
enum class TypedPrefixKind {
    None,
    Bullet,
    Number,
    Letter,
    Roman
};

/// @struct TypedPrefix
/// @brief A list marker typed as plain text at the start of a paragraph
struct TypedPrefix {
    TypedPrefixKind kind = TypedPrefixKind::None;
    std::string prefix;   ///< The marker including trailing whitespace, empty when none
};

/// @brief Detect a typed list marker such as "1.", "a)", "(iv)" or "•"
///
/// The marker must be followed by whitespace.
TypedPrefix detectTypedPrefix(std::string_view text);

/// @brief True for numbered paragraphs and paragraphs with a typed marker
bool isListElement(Paragraph const& paragraph);

/// @brief Round inches to twips
int inchesToTwips(double inches);

/// @brief Configured text indent for a list level, in twips
///
/// Falls back to the last configured level when @p level is not listed.
/// @return std::nullopt when no levels are configured
std::optional<int> textIndentForLevel(ListBulletSettings const& settings, int level);

/// @brief Zero left indentation between 1 and 359 twips on non-list text
///
/// Runs over the body and every table cell, skipping blank paragraphs.
/// @return Number of paragraphs changed
std::size_t removeSmallIndents(Document& document);

/// @brief Align indented continuation text with its list level
///
/// For every non-blank, non-list paragraph with direct indentation, the
/// nearest preceding list item (scanning backwards, stopping at tables and
/// at non-indented text) selects the target indent. Without one, a
/// paragraph directly below other indented text is aligned to level 0.
///
/// @return Number of paragraphs whose indentation changed; 0 when
///         @p options has no list bullet settings
std::size_t applyIndentationRules(Document& document, BlankLineOptions const& options);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_INDENTATION_H
