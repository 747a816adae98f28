/// @file dom_adapter.h
/// @brief HTML parser backend selected at compile time
///
/// The backend (Gumbo or libxml2) is selected via the
/// BLANKLINE_CPP_HTML_BACKEND_* macros set by the build.
///
/// Usage:
/// @code
/// #include <dom_adapter.h>
///
/// blankline_cpp::dom::HtmlNode root = blankline_cpp::dom::parse("<p>Hello</p>");
/// @endcode
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_DOM_ADAPTER_H
#define BLANKLINE_CPP_DOM_ADAPTER_H

#include "html_node.h"

#if defined(BLANKLINE_CPP_HTML_BACKEND_LIBXML2)
    #include "libxml2_adapter.h"
#else
    // Default to Gumbo
    #include "gumbo_adapter.h"
#endif

#include <string>

namespace blankline_cpp::dom {

#if defined(BLANKLINE_CPP_HTML_BACKEND_LIBXML2)
    /// @brief The HTML parser backend namespace
    namespace backend = blankline_cpp::libxml2;
#else
    /// @brief The HTML parser backend namespace
    namespace backend = blankline_cpp::gumbo;
#endif

/// @brief Parse HTML with the selected backend
inline HtmlNode parse(std::string const& html) {
    return backend::parse(html);
}

/// @brief Name of the selected backend ("gumbo" or "libxml2")
inline constexpr char const* backendName() {
    return backend::kBackendName;
}

} // namespace blankline_cpp::dom

#endif // BLANKLINE_CPP_DOM_ADAPTER_H
