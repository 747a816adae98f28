/// @file document_source.cpp
/// @brief Input sources that produce a Document
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "document_source.h"
#include "html_reader.h"
#include "wordml.h"

#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace blankline_cpp {

WordmlSource::WordmlSource(std::string documentXml, std::string stylesXml)
    : documentXml_(std::move(documentXml)),
      stylesXml_(std::move(stylesXml)) {}

Document WordmlSource::load() const {
    return wordml::read(documentXml_, stylesXml_);
}

HtmlSource::HtmlSource(std::string html)
    : html_(std::move(html)) {}

Document HtmlSource::load() const {
    return html::read(html_);
}

std::string readFile(std::string const& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Error: cannot open file '" + path + "'");
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::unique_ptr<DocumentSource> openSource(std::string const& path, bool asHtml,
                                           std::string const& stylesPath) {
    if (asHtml) {
        return std::make_unique<HtmlSource>(readFile(path));
    }
    return std::make_unique<WordmlSource>(readFile(path), stylesPath.empty() ? std::string{} : readFile(stylesPath));
}

} // namespace blankline_cpp
