/// @file wordml.h
/// @brief WordprocessingML (word/document.xml) reader and writer
///
/// The reader builds a Document from the XML of a document part and,
/// optionally, its styles part. It covers what the blank-line engine needs:
/// paragraphs with style, numbering, indentation, spacing and alignment;
/// runs, tabs, breaks, inline drawings, hyperlinks, simple and complex
/// fields, VML shapes, text boxes, tracked insertions and deletions,
/// bookmarks; tables with nested tables. Structured document tags are
/// unwrapped in place. Paragraphs carrying a TOC field instruction are
/// marked preserved.
///
/// The writer serializes a Document back into a `w:document` part.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_WORDML_H
#define BLANKLINE_CPP_WORDML_H

#include "document.h"
#include "parse_error.h"

#include <string>

namespace blankline_cpp::wordml {

/// Main WordprocessingML namespace.
inline constexpr char const* kMainNamespace =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

/// @brief Parse a document part
///
/// @param[in] documentXml Contents of word/document.xml
/// @param[in] stylesXml   Contents of word/styles.xml, or empty
/// @throws ParseError when either part is not well-formed or has no w:body
Document read(std::string const& documentXml, std::string const& stylesXml = {});

/// @brief Add the paragraph styles of a styles part to @p document
/// @throws ParseError when the part is not well-formed
void readStyles(Document& document, std::string const& stylesXml);

/// @brief Serialize @p document as a UTF-8 `w:document` part
std::string write(Document const& document);

} // namespace blankline_cpp::wordml

#endif // BLANKLINE_CPP_WORDML_H
