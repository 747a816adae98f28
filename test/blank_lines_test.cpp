// blankline_cpp/test/blank_lines_test.cpp
#include <gtest/gtest.h>

#include "blank_line_rules.h"
#include "blank_lines.h"
#include "document.h"
#include "image_checks.h"
#include "indentation.h"
#include "paragraph_checks.h"
#include "snapshot.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace blankline_cpp;

namespace {

Paragraph heading1(std::string text) {
    Paragraph p(std::move(text));
    p.setStyle("Heading1");
    return p;
}

Paragraph listItem(std::string text, int numId = 1, int level = 0) {
    Paragraph p(std::move(text));
    p.setNumbering(Numbering{numId, level});
    return p;
}

Paragraph indented(std::string text, int twips) {
    Paragraph p(std::move(text));
    p.setLeftIndent(twips);
    return p;
}

Table makeTable(std::size_t rows, std::size_t columns, std::string const& firstText = "cell") {
    Table table;
    for (std::size_t r = 0; r < rows; ++r) {
        TableRow row;
        for (std::size_t c = 0; c < columns; ++c) {
            TableCell cell;
            cell.addParagraph(Paragraph(r == 0 && c == 0 ? firstText : "cell"));
            row.addCell(std::move(cell));
        }
        table.addRow(std::move(row));
    }
    return table;
}

RuleEngineResult run(Document& doc, BlankLineOptions const& options = {}) {
    removeSmallIndents(doc);
    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
    BlankLineManager manager(options);
    return manager.processBlankLines(doc, snapshot);
}

bool blankAt(Document const& doc, std::size_t index) {
    return index < doc.bodyElementCount() && isBlankParagraph(doc.bodyElementAt(index));
}

std::size_t countPositions(Document const& doc, bool (*pred)(Element const*)) {
    std::size_t n = 0;
    for (std::size_t i = 0; i < doc.bodyElementCount(); ++i) {
        if (pred(doc.bodyElementAt(i))) ++n;
    }
    return n;
}

} // namespace

TEST(BlankLineManager, DefaultOptions) {
    BlankLineManager manager;
    EXPECT_EQ(manager.options().blankStyle, "Normal");
    EXPECT_TRUE(manager.options().markAsPreserved);
    EXPECT_EQ(manager.options().normalStyleFormatting.spaceAfter, 120);
    EXPECT_FALSE(manager.options().listBulletSettings.has_value());
    EXPECT_EQ(manager.removalRules().size(), 10u);
    EXPECT_EQ(manager.additionRules().size(), 11u);
}

TEST(BlankLineManager, ConfigureOptionsChains) {
    BlankLineManager manager;
    manager.configureOptions([](BlankLineOptions& opts) { opts.blankStyle = "Spacer"; })
           .configureOptions([](BlankLineOptions& opts) { opts.normalStyleFormatting.spaceAfter = 0; });
    EXPECT_EQ(manager.options().blankStyle, "Spacer");
    EXPECT_EQ(manager.options().normalStyleFormatting.spaceAfter, 0);
}

TEST(BlankLineManager, HeadingAndListScenarioWithFlushText) {
    Document doc;
    doc.addParagraph(heading1("Intro"));
    doc.addParagraph(Paragraph("line A"));
    doc.addParagraph(listItem("a"));
    doc.addParagraph(listItem("b"));
    doc.addParagraph(Paragraph("line B"));

    RuleEngineResult result = run(doc);
    EXPECT_EQ(result.added, 2u);
    EXPECT_EQ(result.removed, 0u);
    EXPECT_EQ(describe(doc),
              "P[Heading1] \"Intro\"\n"
              "(blank)\n"
              "P \"line A\"\n"
              "P #1.0 \"a\"\n"
              "P #1.0 \"b\"\n"
              "(blank)\n"
              "P \"line B\"\n");
}

TEST(BlankLineManager, HeadingAndListScenarioWithIndentedText) {
    Document doc;
    doc.addParagraph(heading1("Intro"));
    doc.addParagraph(Paragraph("line A"));
    doc.addParagraph(listItem("a"));
    doc.addParagraph(listItem("b"));
    doc.addParagraph(indented("line B", 720));

    RuleEngineResult result = run(doc);
    EXPECT_EQ(result.added, 1u);
    EXPECT_EQ(describe(doc),
              "P[Heading1] \"Intro\"\n"
              "(blank)\n"
              "P \"line A\"\n"
              "P #1.0 \"a\"\n"
              "P #1.0 \"b\"\n"
              "P >720 \"line B\"\n");
}

TEST(BlankLineManager, OriginalBlankSurvivesWhenNoRuleApplies) {
    Document doc;
    doc.addParagraph(Paragraph("x"));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(indented("y", 200));

    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
    RuleEngineResult result = BlankLineManager().processBlankLines(doc, snapshot);
    EXPECT_EQ(result.removed, 0u);
    ASSERT_EQ(doc.bodyElementCount(), 3u);
    EXPECT_TRUE(blankAt(doc, 1));
}

TEST(BlankLineManager, PreservationRestoresLostBlank) {
    Document doc;
    doc.addParagraph(Paragraph("x"));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(indented("y", 200));

    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
    doc.removeBodyElementAt(1);
    doc.insertBodyElementAt(0, std::make_unique<Paragraph>(heading1("Added later")));

    RuleEngineResult result = BlankLineManager().processBlankLines(doc, snapshot);
    EXPECT_EQ(result.preserved, 1u);
    EXPECT_EQ(describe(doc),
              "P[Heading1] \"Added later\"\n"
              "(blank)\n"
              "P \"x\"\n"
              "(blank)\n"
              "P >200 \"y\"\n");
}

TEST(BlankLineManager, RemovalRuleBeatsPreservation) {
    Document doc;
    doc.addParagraph(Paragraph("x"));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(heading1("Title"));
    doc.addParagraph(Paragraph("y"));

    RuleEngineResult result = run(doc);
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(result.preserved, 0u);
    EXPECT_EQ(describe(doc),
              "P \"x\"\n"
              "P[Heading1] \"Title\"\n"
              "(blank)\n"
              "P \"y\"\n");
}

TEST(BlankLineManager, AdjacentBlanksCollapseToOne) {
    Document doc;
    doc.addParagraph(Paragraph("x"));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph("y"));

    run(doc);
    EXPECT_EQ(describe(doc), "P \"x\"\n(blank)\nP \"y\"\n");
}

TEST(BlankLineManager, NoBlankBetweenListItems) {
    Document doc;
    doc.addParagraph(listItem("a", 1));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(listItem("b", 1, 1));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph{});
    doc.addParagraph(listItem("c", 2));
    doc.addParagraph(Paragraph("after"));

    run(doc);
    for (std::size_t i = 1; i < doc.bodyElementCount(); ++i) {
        if (!isListParagraph(doc.bodyElementAt(i))) continue;
        EXPECT_FALSE(blankAt(doc, i - 1) && i >= 2 && isListParagraph(doc.bodyElementAt(i - 2)))
            << "blank between list items at " << i;
    }
    EXPECT_EQ(describe(doc),
              "P #1.0 \"a\"\n"
              "P #1.1 \"b\"\n"
              "P #2.0 \"c\"\n"
              "(blank)\n"
              "P \"after\"\n");
}

TEST(BlankLineManager, TableSpacing) {
    Document doc;
    doc.addParagraph(Paragraph("x"));
    doc.addParagraph(Paragraph{});
    doc.addTable(makeTable(2, 2));
    doc.addParagraph(Paragraph("y"));

    RuleEngineResult result = run(doc);
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(result.added, 1u);
    ASSERT_EQ(doc.bodyElementCount(), 4u);
    EXPECT_TRUE(doc.bodyElementAt(1)->isTable());
    EXPECT_FALSE(blankAt(doc, 0));
    EXPECT_TRUE(blankAt(doc, 2));
}

TEST(BlankLineManager, OneByOneTableSpacing) {
    Document doc;
    doc.addParagraph(Paragraph("intro"));
    doc.addTable(makeTable(1, 1, "Purpose"));
    doc.addParagraph(Paragraph("text"));

    run(doc);
    ASSERT_EQ(doc.bodyElementCount(), 5u);
    EXPECT_TRUE(blankAt(doc, 1));
    EXPECT_TRUE(doc.bodyElementAt(2)->isTable());
    EXPECT_TRUE(blankAt(doc, 3));
}

TEST(BlankLineManager, LargeImageGetsBlankAboveAndBelow) {
    Document doc;
    doc.addParagraph(Paragraph("text"));
    doc.addParagraph(Paragraph{}).addContent(ContentItem::imageRun(400 * kEmuPerPixel, 300 * kEmuPerPixel));
    doc.addParagraph(Paragraph("more"));

    RuleEngineResult result = run(doc);
    EXPECT_EQ(result.added, 2u);
    EXPECT_EQ(describe(doc),
              "P \"text\"\n"
              "(blank)\n"
              "P [img] \"\"\n"
              "(blank)\n"
              "P \"more\"\n");
}

TEST(BlankLineManager, CaptionKeepsLargeImageTight) {
    Document doc;
    doc.addParagraph(Paragraph("Figure 1")).setAlignment(Alignment::Center);
    doc.addParagraph(Paragraph{}).addContent(ContentItem::imageRun(400 * kEmuPerPixel, 300 * kEmuPerPixel));

    run(doc);
    EXPECT_EQ(describe(doc),
              "P \"Figure 1\"\n"
              "P [img] \"\"\n"
              "(blank)\n");
}

TEST(BlankLineManager, TopOfDocumentLinkLosesIndent) {
    Document doc;
    doc.addParagraph(Paragraph("text"));
    Paragraph link;
    link.setLeftIndent(720);
    link.addContent(ContentItem::hyperlink("Top of the Document", "#_top"));
    doc.addParagraph(std::move(link));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph("next"));

    run(doc);
    EXPECT_EQ(describe(doc),
              "P \"text\"\n"
              "(blank)\n"
              "P \"Top of the Document\"\n"
              "P \"next\"\n");
}

TEST(BlankLineManager, CellCleanup) {
    Table table = makeTable(2, 1, "Alpha");
    TableCell& cell = table.rows()[0].cells()[0];
    cell.insertParagraphAt(0, Paragraph{});
    cell.addParagraph(Paragraph{});

    Document doc;
    doc.addTable(std::move(table));

    RuleEngineResult result = run(doc);
    EXPECT_EQ(result.removed, 2u);
    TableCell const* first = doc.allTables()[0]->cellAt(0, 0);
    ASSERT_EQ(first->paragraphCount(), 1u);
    EXPECT_EQ(first->paragraphAt(0)->text(), "Alpha");
}

TEST(BlankLineManager, CellAdditionNeverAppendsPastLastParagraph) {
    Table table = makeTable(1, 2);
    TableCell& cell = table.rows()[0].cells()[0];
    cell.insertParagraphAt(0, Paragraph("Scope"));
    cell.paragraphAt(0)->setStyle("Heading1");
    cell.addParagraph(listItem("only item"));

    Document doc;
    doc.addTable(std::move(table));
    run(doc);

    TableCell const* result = doc.allTables()[0]->cellAt(0, 0);
    // Heading rules are body-only; the trailing list item gets nothing appended.
    ASSERT_EQ(result->paragraphCount(), 3u);
    EXPECT_FALSE(isParagraphBlank(*result->paragraphAt(2)));
}

TEST(BlankLineManager, CellKeepsAtLeastOneParagraph) {
    Table table = makeTable(2, 1);
    TableCell& cell = table.rows()[1].cells()[0];
    cell.removeParagraphAt(0);
    cell.addParagraph(Paragraph{});

    Document doc;
    doc.addTable(std::move(table));
    run(doc);

    TableCell const* lonely = doc.allTables()[0]->cellAt(1, 0);
    ASSERT_EQ(lonely->paragraphCount(), 1u);
    EXPECT_TRUE(isParagraphBlank(*lonely->paragraphAt(0)));
}

TEST(BlankLineManager, TablesWithNestedContentAreUntouched) {
    Table outer = makeTable(2, 1, "Outer");
    TableCell& cell = outer.rows()[0].cells()[0];
    cell.insertParagraphAt(0, Paragraph{});
    cell.addTable(makeTable(1, 1, "Inner"));
    cell.addParagraph(Paragraph{});
    cell.addParagraph(Paragraph{});

    Document doc;
    doc.addTable(std::move(outer));
    run(doc);

    TableCell const* result = doc.allTables()[0]->cellAt(0, 0);
    EXPECT_EQ(result->paragraphCount(), 4u);
    EXPECT_TRUE(result->hasNestedTables());
}

TEST(BlankLineManager, CellBlankPreservedFromSnapshot) {
    Table table = makeTable(1, 2, "Purpose");
    TableCell& cell = table.rows()[0].cells()[0];
    cell.addParagraph(Paragraph{});
    cell.addParagraph(Paragraph("Details"));
    cell.addParagraph(Paragraph("More"));

    Document doc;
    doc.addTable(std::move(table));
    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);

    // Losing the blank changes the first cell's text, and with it the key
    // a fresh cell id would be built from.
    doc.allTables()[0]->cellAt(0, 0)->removeParagraphAt(1);
    ASSERT_EQ(snapshot.tableKeys.size(), 1u);
    EXPECT_NE(firstCellText(*doc.allTables()[0]), snapshot.tableKeys[0]);

    RuleEngineResult result = BlankLineManager().processBlankLines(doc, snapshot);

    EXPECT_EQ(result.preserved, 1u);
    TableCell const* restored = doc.allTables()[0]->cellAt(0, 0);
    ASSERT_EQ(restored->paragraphCount(), 4u);
    EXPECT_TRUE(isParagraphBlank(*restored->paragraphAt(1)));
    EXPECT_EQ(restored->paragraphAt(2)->text(), "Details");
}

TEST(BlankLineManager, CellBlankAboveLastParagraphNotRestored) {
    Table table = makeTable(1, 2, "Purpose");
    TableCell& cell = table.rows()[0].cells()[1];
    cell.addParagraph(Paragraph{});
    cell.addParagraph(Paragraph("Details"));

    Document doc;
    doc.addTable(std::move(table));
    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);

    doc.allTables()[0]->cellAt(0, 1)->removeParagraphAt(1);
    RuleEngineResult result = BlankLineManager().processBlankLines(doc, snapshot);

    EXPECT_EQ(result.preserved, 0u);
    TableCell const* untouched = doc.allTables()[0]->cellAt(0, 1);
    ASSERT_EQ(untouched->paragraphCount(), 2u);
    EXPECT_EQ(untouched->paragraphAt(1)->text(), "Details");
}

TEST(BlankLineManager, BlanksAreNormalized) {
    Document doc;
    doc.addParagraph(heading1("Intro"));
    doc.addParagraph(Paragraph("body"));
    doc.addParagraph(Paragraph(" ")).setStyle("Heading3");
    doc.addParagraph(Paragraph("end"));

    BlankLineOptions options;
    options.normalStyleFormatting.spaceAfter = 0;
    options.normalStyleFormatting.lineSpacing = 240;
    options.normalStyleFormatting.fontSize = 10.0;
    options.normalStyleFormatting.fontFamily = "Arial";
    run(doc, options);

    for (std::size_t i = 0; i < doc.bodyElementCount(); ++i) {
        auto const* paragraph = doc.bodyElementAt(i)->asParagraph();
        if (!paragraph || !isParagraphBlank(*paragraph)) continue;
        EXPECT_EQ(paragraph->style(), "Normal");
        EXPECT_EQ(paragraph->formatting().spaceAfter, 0);
        EXPECT_EQ(paragraph->formatting().lineSpacing, 240);
        EXPECT_EQ(paragraph->markFormatting().fontSize, 10.0);
        EXPECT_EQ(paragraph->markFormatting().fontFamily, "Arial");
    }
    ASSERT_TRUE(blankAt(doc, 3));
    auto const& runs = doc.bodyElementAt(3)->asParagraph()->content();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].formatting.fontFamily, "Arial");
}

TEST(BlankLineManager, CreatedBlanksArePreserved) {
    Document doc;
    doc.addParagraph(heading1("Intro"));
    doc.addParagraph(Paragraph("body"));
    run(doc);
    ASSERT_TRUE(blankAt(doc, 1));
    EXPECT_TRUE(doc.bodyElementAt(1)->asParagraph()->isPreserved());

    Document plain;
    plain.addParagraph(heading1("Intro"));
    plain.addParagraph(Paragraph("body"));
    BlankLineOptions options;
    options.markAsPreserved = false;
    run(plain, options);
    ASSERT_TRUE(blankAt(plain, 1));
    EXPECT_FALSE(plain.bodyElementAt(1)->asParagraph()->isPreserved());
}

TEST(BlankLineManager, PreservedBlanksSurviveRemovalRules) {
    Document doc;
    doc.addParagraph(listItem("a"));
    Paragraph kept;
    kept.setPreserved(true);
    doc.addParagraph(std::move(kept));
    doc.addParagraph(listItem("b"));

    run(doc);
    EXPECT_TRUE(blankAt(doc, 1));
}

TEST(BlankLineManager, CustomRuleTakesPrecedence) {
    Document doc;
    doc.addParagraph(Paragraph("x"));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(Paragraph("Step two")).setStyle("Heading2");

    BlankLineManager manager;
    manager.addRule({"remove-above-heading2", RuleAction::Remove, RuleScope::Body,
        [](RuleContext const& ctx) {
            auto const* next = ctx.nextParagraph();
            return isBlankParagraph(ctx.current) && next && next->style() == "Heading2";
        }});
    EXPECT_EQ(manager.removalRules().size(), 11u);

    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
    RuleEngineResult result = manager.processBlankLines(doc, snapshot);
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(result.preserved, 0u);
    EXPECT_EQ(doc.bodyElementCount(), 2u);
}

TEST(BlankLineManager, IndentationRunsAfterRules) {
    Document doc;
    doc.addParagraph(listItem("a"));
    doc.addParagraph(Paragraph{});
    doc.addParagraph(indented("continued", 1000));

    BlankLineOptions options;
    options.listBulletSettings = ListBulletSettings{{{0, 0.25, 0.5}}};
    RuleEngineResult result = run(doc, options);

    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(result.indentationFixed, 1u);
    EXPECT_EQ(describe(doc),
              "P #1.0 \"a\"\n"
              "P >720 \"continued\"\n");
}

TEST(BlankLineManager, SecondRunChangesNothing) {
    auto build = [] {
        Document doc;
        doc.addParagraph(heading1("Purpose"));
        doc.addParagraph(Paragraph{});
        doc.addParagraph(Paragraph{});
        doc.addParagraph(Paragraph("This procedure covers audits."));
        Paragraph label;
        label.addContent(ContentItem::boldRun("Note:"));
        label.addContent(ContentItem::run(" read first."));
        doc.addParagraph(std::move(label));
        doc.addParagraph(listItem("one"));
        doc.addParagraph(Paragraph{});
        doc.addParagraph(listItem("two"));
        doc.addParagraph(indented("continued", 900));
        doc.addTable(makeTable(1, 1, "Related Documents"));
        doc.addParagraph(Paragraph("x"));
        doc.addTable(makeTable(3, 2));
        doc.addParagraph(Paragraph{}).addContent(ContentItem::imageRun(500 * kEmuPerPixel, 400 * kEmuPerPixel));
        doc.addParagraph(Paragraph("Paper copy = informational only"));
        return doc;
    };

    BlankLineOptions options;
    options.listBulletSettings = ListBulletSettings{{{0, 0.25, 0.5}}};

    Document doc = build();
    run(doc, options);
    std::string first = describe(doc);

    RuleEngineResult second = run(doc, options);
    EXPECT_EQ(second.removed, 0u);
    EXPECT_EQ(second.added, 0u);
    EXPECT_EQ(second.preserved, 0u);
    EXPECT_EQ(second.indentationFixed, 0u);
    EXPECT_EQ(describe(doc), first);

    // Heading invariant: no blank above a heading, at least one after.
    for (std::size_t i = 0; i < doc.bodyElementCount(); ++i) {
        auto const* paragraph = doc.bodyElementAt(i)->asParagraph();
        if (!paragraph || !isHeading1(*paragraph)) continue;
        EXPECT_FALSE(i > 0 && blankAt(doc, i - 1));
        if (i + 1 < doc.bodyElementCount()) EXPECT_TRUE(blankAt(doc, i + 1));
    }
    // Table invariant for tables larger than 1x1.
    for (std::size_t i = 0; i < doc.bodyElementCount(); ++i) {
        auto const* table = doc.bodyElementAt(i)->asTable();
        if (!table || !table->isLargerThan1x1()) continue;
        EXPECT_FALSE(i > 0 && blankAt(doc, i - 1));
        EXPECT_TRUE(blankAt(doc, i + 1));
    }
    EXPECT_EQ(countPositions(doc, [](Element const* e) { return e->isTable(); }), 2u);

    // Bold labels inside a cell get their blanks on the first run only.
    auto boldLabel = [](std::string text) {
        Paragraph p;
        p.addContent(ContentItem::boldRun(std::move(text)));
        return p;
    };
    Table labels;
    {
        TableCell cell;
        cell.addParagraph(boldLabel("Note: a"));
        cell.addParagraph(Paragraph("b"));
        cell.addParagraph(boldLabel("Tip: c"));
        cell.addParagraph(Paragraph("d"));
        TableRow row;
        row.addCell(std::move(cell));
        labels.addRow(std::move(row));
    }
    Document cellDoc;
    cellDoc.addTable(std::move(labels));
    cellDoc.addParagraph(Paragraph("y"));

    RuleEngineResult firstCellRun = run(cellDoc, options);
    EXPECT_EQ(firstCellRun.added, 4u);
    std::string afterFirst = describe(cellDoc);

    RuleEngineResult secondCellRun = run(cellDoc, options);
    EXPECT_EQ(secondCellRun.removed + secondCellRun.added + secondCellRun.preserved
                  + secondCellRun.indentationFixed, 0u);
    EXPECT_EQ(describe(cellDoc), afterFirst);
    EXPECT_EQ(cellDoc.allTables()[0]->cellAt(0, 0)->paragraphCount(), 7u);
}
