/// @file document_source.h
/// @brief Input sources that produce a Document
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_DOCUMENT_SOURCE_H
#define BLANKLINE_CPP_DOCUMENT_SOURCE_H

#include "document.h"

#include <memory>
#include <string>

namespace blankline_cpp {

class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /// @brief Build a fresh Document
    /// @throws ParseError on malformed input
    virtual Document load() const = 0;
};

class WordmlSource final : public DocumentSource {
public:
    explicit WordmlSource(std::string documentXml, std::string stylesXml = {});

    Document load() const override;

    std::string const& documentXml() const { return documentXml_; }
    std::string const& stylesXml() const { return stylesXml_; }

private:
    std::string documentXml_;
    std::string stylesXml_;
};

class HtmlSource final : public DocumentSource {
public:
    explicit HtmlSource(std::string html);

    Document load() const override;

    std::string const& html() const { return html_; }

private:
    std::string html_;
};

/// @brief Read a whole file into a string
/// @throws std::runtime_error when the file cannot be opened
std::string readFile(std::string const& path);

/// @brief Pick a source for @p path: HTML when @p asHtml, WordprocessingML otherwise
std::unique_ptr<DocumentSource> openSource(std::string const& path, bool asHtml,
                                           std::string const& stylesPath = {});

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_DOCUMENT_SOURCE_H
