/// @file libxml2_adapter.h
/// @brief libxml2 HTML parser backend
///
/// Uses libxml2's tolerant HTML parser (htmlReadMemory). It follows an
/// older HTML parsing model than gumbo but needs no extra dependency, as
/// libxml2 already reads WordprocessingML.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_LIBXML2_ADAPTER_H
#define BLANKLINE_CPP_LIBXML2_ADAPTER_H

#include "html_node.h"

#include <string>

namespace blankline_cpp::libxml2 {

inline constexpr char const* kBackendName = "libxml2";

/// @brief Parse @p html with libxml2 and copy the tree
/// @return A Document node whose children are the top-level elements
/// @throws ParseError when libxml2 cannot produce a document
dom::HtmlNode parse(std::string const& html);

} // namespace blankline_cpp::libxml2

#endif // BLANKLINE_CPP_LIBXML2_ADAPTER_H
