/// @file gumbo_adapter.h
/// @brief Gumbo HTML5 parser backend
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_GUMBO_ADAPTER_H
#define BLANKLINE_CPP_GUMBO_ADAPTER_H

#include "html_node.h"

#include <string>

namespace blankline_cpp::gumbo {

inline constexpr char const* kBackendName = "gumbo";

/// @brief Parse @p html with gumbo and copy the tree
/// @return A Document node whose children are the top-level elements
dom::HtmlNode parse(std::string const& html);

} // namespace blankline_cpp::gumbo

#endif // BLANKLINE_CPP_GUMBO_ADAPTER_H
