/// @file html_reader.h
/// @brief Build a Document from HTML
///
/// Mapping:
///
/// | HTML                         | Document                                  |
/// |------------------------------|-------------------------------------------|
/// | `h1`..`h6`                   | paragraph styled Heading1..Heading6        |
/// | `p`, leaf `div`              | paragraph                                  |
/// | `ul`/`ol` > `li`             | numbered paragraph, level = nesting depth  |
/// | `table` > `tr` > `td`/`th`   | table, rows and cells                      |
/// | `img width height`           | image run, pixels converted to EMU         |
/// | `a href`                     | hyperlink                                  |
/// | `b`/`strong`, `i`/`em`       | bold / italic runs                         |
/// | `align=center`, `text-align` | paragraph alignment                        |
/// | `margin-left`/`padding-left` | left indentation (px, pt, in)              |
///
/// Empty paragraphs (`<p></p>`, `<p>&nbsp;</p>`) become blank paragraphs.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_HTML_READER_H
#define BLANKLINE_CPP_HTML_READER_H

#include "document.h"
#include "html_node.h"
#include "parse_error.h"

#include <optional>
#include <string>
#include <string_view>

namespace blankline_cpp::html {

/// @brief Parse @p html with the configured backend and build a Document
/// @throws ParseError when the backend cannot parse the input
Document read(std::string const& html);

/// @brief Build a Document from an already parsed tree
Document build(dom::HtmlNode const& root);

/// @brief Left indentation of a CSS declaration list, in twips
///
/// Reads `margin-left` or `padding-left` with a px, pt or in unit
/// (unitless values are pixels).
std::optional<int> cssLeftIndent(std::string_view style);

} // namespace blankline_cpp::html

#endif // BLANKLINE_CPP_HTML_READER_H
