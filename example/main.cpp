// blankline_cpp/example/main.cpp
#include "blank_lines.h"
#include "cleanup.h"
#include "document.h"
#include "image_checks.h"
#include "indentation.h"
#include "snapshot.h"

#include <functional>
#include <iostream>
#include <string>
#include <utility>

using namespace blankline_cpp;

namespace {

Document sampleDocument() {
    Document doc;
    doc.addParagraph(Paragraph("Intro")).setStyle("Heading1");
    doc.addParagraph(Paragraph("This procedure covers the monthly review."));
    doc.addParagraph(Paragraph{});

    Paragraph label;
    label.addContent(ContentItem::boldRun("Note:"));
    label.addContent(ContentItem::run(" read the whole section first."));
    doc.addParagraph(std::move(label));

    doc.addParagraph(Paragraph("Collect the reports")).setNumbering(Numbering{1, 0});
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph("Compare the totals")).setNumbering(Numbering{1, 0});
    doc.addParagraph(Paragraph("Totals must match the ledger.")).setLeftIndent(200);

    TableRow row;
    TableCell cell;
    cell.addParagraph(Paragraph("Related Documents"));
    row.addCell(std::move(cell));
    Table table;
    table.addRow(std::move(row));
    doc.addTable(std::move(table));

    doc.addParagraph(Paragraph("Figure 1")).setAlignment(Alignment::Center);
    doc.addParagraph(Paragraph{}).addContent(ContentItem::imageRun(300 * kEmuPerPixel, 200 * kEmuPerPixel));
    doc.addParagraph(Paragraph{}).addContent(ContentItem::hyperlink("Top of the Document", "#_top"));
    return doc;
}

} // namespace

int main() {
    BlankLineManager manager;
    BlankLineOptions defaults = manager.options();

    auto demo = [&](std::string const& title, std::function<void(BlankLineOptions&)> configure) {
        manager.configureOptions([&](BlankLineOptions& opts) {
            opts = defaults;
            configure(opts);
        });

        Document doc = sampleDocument();
        std::cout << title << "\n-- before --\n" << describe(doc);

        removeSmallIndents(doc);
        BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
        RuleEngineResult result = manager.processBlankLines(doc, snapshot);

        std::cout << "-- after --\n" << describe(doc)
                  << "removed=" << result.removed << " added=" << result.added
                  << " preserved=" << result.preserved
                  << " indentationFixed=" << result.indentationFixed << "\n\n";
    };

    demo("**Defaults**", [](BlankLineOptions&) {});

    demo("**List continuation aligned to 0.5\"**", [](BlankLineOptions& opts) {
        opts.listBulletSettings = ListBulletSettings{{{0, 0.25, 0.5}, {1, 0.75, 1.0}}};
    });

    demo("**Tight blanks, Arial 10pt**", [](BlankLineOptions& opts) {
        opts.normalStyleFormatting.spaceAfter = 0;
        opts.normalStyleFormatting.fontSize = 10.0;
        opts.normalStyleFormatting.fontFamily = "Arial";
    });

    Document doc = sampleDocument();
    std::size_t removed = removeBlanksBetweenListItems(doc);
    std::cout << "**Standalone list cleanup** removed " << removed << "\n" << describe(doc);
    return 0;
}
