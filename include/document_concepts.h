/// @file document_concepts.h
/// @brief C++20 concepts for the host document tree
///
/// The blank-line engine only talks to the document through the accessors
/// described here: body element access and in-place mutation, table rows and
/// cells, cell paragraph lists, and paragraph formatting. Any tree that
/// satisfies these concepts can back the engine; the bundled in-memory model
/// (document.h) is checked against them at compile time.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_DOCUMENT_CONCEPTS_H
#define BLANKLINE_CPP_DOCUMENT_CONCEPTS_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace blankline_cpp::host {

/// @brief Concept for an image carried by an image run
template<typename T>
concept ImageLike = requires(T const& image) {
    { image.width() } -> std::convertible_to<std::int64_t>;
    { image.height() } -> std::convertible_to<std::int64_t>;
};

/// @brief Concept for a paragraph of the host tree
template<typename P>
concept ParagraphLike = requires(P& p, P const& cp, std::string const& s, int twips) {
    { cp.text() } -> std::convertible_to<std::string>;
    { cp.content() };
    { cp.style() } -> std::convertible_to<std::string>;
    { p.setStyle(s) };
    { cp.numbering() };
    { cp.formatting() };
    { p.setLeftIndent(twips) };
    { p.setSpaceBefore(twips) };
    { p.setSpaceAfter(twips) };
    { p.setLineSpacing(twips) };
    { cp.isPreserved() } -> std::same_as<bool>;
};

/// @brief Concept for a table cell owning a paragraph list
template<typename C, typename P>
concept TableCellLike = requires(C& c, C const& cc, std::size_t i, P para) {
    { cc.paragraphCount() } -> std::convertible_to<std::size_t>;
    { c.paragraphAt(i) } -> std::same_as<P*>;
    { c.insertParagraphAt(i, std::move(para)) };
    { c.removeParagraphAt(i) };
    { cc.hasNestedTables() } -> std::same_as<bool>;
};

/// @brief Concept for a table
template<typename T, typename C>
concept TableLike = requires(T& t, T const& ct, std::size_t r, std::size_t c) {
    { ct.rowCount() } -> std::convertible_to<std::size_t>;
    { ct.columnCount() } -> std::convertible_to<std::size_t>;
    { t.rows() };
    { t.cellAt(r, c) } -> std::same_as<C*>;
};

/// @brief Concept for the document body
template<typename D, typename E>
concept DocumentLike = requires(D& d, D const& cd, std::size_t i, std::unique_ptr<E> el) {
    { cd.bodyElementCount() } -> std::convertible_to<std::size_t>;
    { d.bodyElementAt(i) } -> std::same_as<E*>;
    { d.insertBodyElementAt(i, std::move(el)) };
    { d.removeBodyElementAt(i) };
    { d.allTables() };
};

} // namespace blankline_cpp::host

#endif // BLANKLINE_CPP_DOCUMENT_CONCEPTS_H
