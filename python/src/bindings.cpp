#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "blank_lines.h"
#include "html_reader.h"
#include "indentation.h"
#include "parse_error.h"
#include "snapshot.h"
#include "wordml.h"

#include <string>
#include <utility>

namespace py = pybind11;

namespace {

using blankline_cpp::BlankLineManager;
using blankline_cpp::BlankLineOptions;
using blankline_cpp::Document;
using blankline_cpp::ListBulletSettings;
using blankline_cpp::ListLevelSetting;
using blankline_cpp::NormalStyleFormatting;
using blankline_cpp::RuleEngineResult;

RuleEngineResult run_pipeline(Document& doc, BlankLineOptions const& options) {
    blankline_cpp::removeSmallIndents(doc);
    auto snapshot = blankline_cpp::captureBlankLineSnapshot(doc);
    BlankLineManager manager(options);
    return manager.processBlankLines(doc, snapshot);
}

} // namespace

PYBIND11_MODULE(blankline, m) {
    m.doc() = "blankline_cpp Python bindings";

    py::register_exception<blankline_cpp::ParseError>(m, "ParseError", PyExc_ValueError);

    py::class_<ListLevelSetting>(m, "ListLevelSetting")
        .def(py::init<>())
        .def(py::init([](int level, double symbolIndent, double textIndent) {
                 return ListLevelSetting{level, symbolIndent, textIndent};
             }),
             py::arg("level"), py::arg("symbol_indent"), py::arg("text_indent"))
        .def_readwrite("level", &ListLevelSetting::level)
        .def_readwrite("symbolIndent", &ListLevelSetting::symbolIndent)
        .def_readwrite("textIndent", &ListLevelSetting::textIndent);

    py::class_<ListBulletSettings>(m, "ListBulletSettings")
        .def(py::init<>())
        .def_readwrite("indentationLevels", &ListBulletSettings::indentationLevels);

    py::class_<NormalStyleFormatting>(m, "NormalStyleFormatting")
        .def(py::init<>())
        .def_readwrite("spaceBefore", &NormalStyleFormatting::spaceBefore)
        .def_readwrite("spaceAfter", &NormalStyleFormatting::spaceAfter)
        .def_readwrite("lineSpacing", &NormalStyleFormatting::lineSpacing)
        .def_readwrite("fontSize", &NormalStyleFormatting::fontSize)
        .def_readwrite("fontFamily", &NormalStyleFormatting::fontFamily);

    py::class_<BlankLineOptions>(m, "BlankLineOptions")
        .def(py::init<>())
        .def_readwrite("listBulletSettings", &BlankLineOptions::listBulletSettings)
        .def_readwrite("normalStyleFormatting", &BlankLineOptions::normalStyleFormatting)
        .def_readwrite("stopBoldColonAfterHeading", &BlankLineOptions::stopBoldColonAfterHeading)
        .def_readwrite("blankStyle", &BlankLineOptions::blankStyle)
        .def_readwrite("markAsPreserved", &BlankLineOptions::markAsPreserved);

    py::class_<RuleEngineResult>(m, "RuleEngineResult")
        .def_readonly("removed", &RuleEngineResult::removed)
        .def_readonly("added", &RuleEngineResult::added)
        .def_readonly("preserved", &RuleEngineResult::preserved)
        .def_readonly("indentationFixed", &RuleEngineResult::indentationFixed)
        .def("__repr__", [](RuleEngineResult const& r) {
            return "RuleEngineResult(removed=" + std::to_string(r.removed)
                + ", added=" + std::to_string(r.added)
                + ", preserved=" + std::to_string(r.preserved)
                + ", indentationFixed=" + std::to_string(r.indentationFixed) + ")";
        });

    m.def(
        "process_wordml",
        [](std::string const& documentXml, std::string const& stylesXml, BlankLineOptions const& options) {
            std::string xml;
            RuleEngineResult result;
            {
                py::gil_scoped_release release;
                Document doc = blankline_cpp::wordml::read(documentXml, stylesXml);
                result = run_pipeline(doc, options);
                xml = blankline_cpp::wordml::write(doc);
            }
            return py::make_tuple(xml, result);
        },
        py::arg("document_xml"),
        py::arg("styles_xml") = std::string{},
        py::arg("options") = BlankLineOptions{},
        "Normalize blank lines in a word/document.xml string; returns (xml, result)"
    );

    m.def(
        "describe_html",
        [](std::string const& html, BlankLineOptions const& options) {
            py::gil_scoped_release release;
            Document doc = blankline_cpp::html::read(html);
            run_pipeline(doc, options);
            return blankline_cpp::describe(doc);
        },
        py::arg("html"),
        py::arg("options") = BlankLineOptions{},
        "Normalize blank lines of an HTML document and return its outline"
    );
}
