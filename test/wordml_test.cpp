// blankline_cpp/test/wordml_test.cpp
#include <gtest/gtest.h>

#include "blank_lines.h"
#include "document.h"
#include "image_checks.h"
#include "indentation.h"
#include "paragraph_checks.h"
#include "snapshot.h"
#include "wordml.h"

#include <cstddef>
#include <string>

using namespace blankline_cpp;

namespace {

std::string wrapBody(std::string const& body) {
    return R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
           R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main")"
           R"( xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships")"
           R"( xmlns:wp="http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing")"
           R"( xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main")"
           R"( xmlns:v="urn:schemas-microsoft-com:vml">)"
           "<w:body>" + body + "</w:body></w:document>";
}

Paragraph const& paragraphAt(Document const& doc, std::size_t index) {
    return *doc.bodyElementAt(index)->asParagraph();
}

constexpr char const* kStyles =
    R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:style w:type="paragraph" w:styleId="Normal"><w:name w:val="Normal"/></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Quote"><w:name w:val="Quote"/>)"
    R"(<w:pPr><w:ind w:left="864"/></w:pPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Odd"><w:pPr><w:ind w:hanging="200"/></w:pPr></w:style>)"
    R"(<w:style w:type="character" w:styleId="Strong"><w:name w:val="Strong"/></w:style>)"
    R"(</w:styles>)";

} // namespace

TEST(WordmlReader, ParagraphProperties) {
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:pPr><w:pStyle w:val="Heading2"/><w:jc w:val="center"/></w:pPr>)"
        R"(<w:r><w:t>Title</w:t></w:r></w:p>)"
        R"(<w:p><w:pPr><w:numPr><w:ilvl w:val="1"/><w:numId w:val="4"/></w:numPr>)"
        R"(<w:ind w:left="1440" w:hanging="360"/>)"
        R"(<w:spacing w:before="40" w:after="120" w:line="240"/></w:pPr>)"
        R"(<w:r><w:t xml:space="preserve">Item </w:t></w:r><w:r><w:tab/><w:t>two</w:t></w:r></w:p>)"
        R"(<w:p><w:pPr><w:ind w:start="300"/><w:jc w:val="both"/></w:pPr></w:p>)"));

    ASSERT_EQ(doc.bodyElementCount(), 3u);

    auto const& title = paragraphAt(doc, 0);
    EXPECT_EQ(title.style(), "Heading2");
    EXPECT_EQ(title.alignment(), Alignment::Center);
    EXPECT_EQ(title.text(), "Title");

    auto const& item = paragraphAt(doc, 1);
    ASSERT_TRUE(item.numbering().has_value());
    EXPECT_EQ(item.numbering()->numId, 4);
    EXPECT_EQ(item.numbering()->level, 1);
    EXPECT_EQ(item.formatting().leftIndent, 1440);
    EXPECT_EQ(item.formatting().spaceBefore, 40);
    EXPECT_EQ(item.formatting().spaceAfter, 120);
    EXPECT_EQ(item.formatting().lineSpacing, 240);
    EXPECT_EQ(item.text(), "Item \ttwo");

    auto const& empty = paragraphAt(doc, 2);
    EXPECT_EQ(empty.formatting().leftIndent, 300);
    EXPECT_EQ(empty.alignment(), Alignment::Both);
    EXPECT_TRUE(isParagraphBlank(empty));
}

TEST(WordmlReader, RunFormatting) {
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:pPr><w:rPr><w:b/></w:rPr></w:pPr>)"
        R"(<w:r><w:rPr><w:rFonts w:ascii="Arial"/><w:b/><w:sz w:val="22"/></w:rPr><w:t>Note:</w:t></w:r>)"
        R"(<w:r><w:rPr><w:b w:val="0"/><w:i/></w:rPr><w:t> details</w:t></w:r></w:p>)"));

    auto const& p = paragraphAt(doc, 0);
    EXPECT_TRUE(p.markFormatting().bold);
    ASSERT_EQ(p.content().size(), 2u);

    auto const& strong = p.content()[0].formatting;
    EXPECT_TRUE(strong.bold);
    EXPECT_EQ(strong.fontSize, 11.0);
    EXPECT_EQ(strong.fontFamily, "Arial");

    auto const& plain = p.content()[1].formatting;
    EXPECT_FALSE(plain.bold);
    EXPECT_TRUE(plain.italic);
    EXPECT_TRUE(startsWithBoldColon(p));
}

TEST(WordmlReader, HyperlinksAndFields) {
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:hyperlink w:anchor="_top"><w:r><w:t>Top of Document</w:t></w:r></w:hyperlink></w:p>)"
        R"(<w:p><w:hyperlink r:id="rId7"><w:r><w:t>Site</w:t></w:r></w:hyperlink></w:p>)"
        R"(<w:p><w:fldSimple w:instr=" PAGE "><w:r><w:t>3</w:t></w:r></w:fldSimple></w:p>)"
        R"(<w:p><w:r><w:fldChar w:fldCharType="begin"/></w:r>)"
        R"(<w:r><w:instrText xml:space="preserve"> TOC \o "1-3" </w:instrText></w:r>)"
        R"(<w:r><w:fldChar w:fldCharType="separate"/></w:r>)"
        R"(<w:r><w:t>Contents</w:t></w:r>)"
        R"(<w:r><w:fldChar w:fldCharType="end"/></w:r></w:p>)"));

    ASSERT_EQ(doc.bodyElementCount(), 4u);

    auto const& top = paragraphAt(doc, 0);
    ASSERT_EQ(top.content().size(), 1u);
    EXPECT_EQ(top.content()[0].kind, ContentKind::Hyperlink);
    EXPECT_EQ(top.content()[0].target, "#_top");
    EXPECT_TRUE(hasTopOfDocumentHyperlink(top));

    EXPECT_EQ(paragraphAt(doc, 1).content()[0].target, "rId7");

    auto const& page = paragraphAt(doc, 2);
    EXPECT_EQ(page.content()[0].kind, ContentKind::Field);
    EXPECT_EQ(page.content()[0].target, "PAGE");
    EXPECT_EQ(page.text(), "3");
    EXPECT_FALSE(page.isPreserved());

    auto const& toc = paragraphAt(doc, 3);
    ASSERT_EQ(toc.content().size(), 1u);
    EXPECT_EQ(toc.content()[0].target, "TOC \\o \"1-3\"");
    EXPECT_EQ(toc.text(), "Contents");
    EXPECT_TRUE(toc.isPreserved());
}

TEST(WordmlReader, ImagesShapesAndTextBoxes) {
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:pPr><w:jc w:val="center"/></w:pPr><w:r><w:drawing><wp:inline>)"
        R"(<wp:extent cx="5486400" cy="3200400"/><wp:docPr id="1" name="Diagram"/>)"
        R"(<a:graphic><a:graphicData><a:blip r:embed="rId9"/></a:graphicData></a:graphic>)"
        R"(</wp:inline></w:drawing></w:r></w:p>)"
        R"(<w:p><w:r><w:pict><v:rect/></w:pict></w:r></w:p>)"
        R"(<w:p><w:r><w:pict><v:shape><v:textbox><w:txbxContent>)"
        R"(<w:p><w:r><w:t>boxed</w:t></w:r></w:p>)"
        R"(</w:txbxContent></v:textbox></v:shape></w:pict></w:r></w:p>)"));

    ASSERT_EQ(doc.bodyElementCount(), 3u);

    auto const& picture = paragraphAt(doc, 0);
    Image const* image = firstImageIn(picture);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->widthEmu, 5486400);
    EXPECT_EQ(image->heightEmu, 3200400);
    EXPECT_EQ(image->name, "Diagram");
    EXPECT_EQ(image->relationshipId, "rId9");
    EXPECT_FALSE(isParagraphBlank(picture));

    EXPECT_EQ(paragraphAt(doc, 1).content()[0].kind, ContentKind::Shape);
    EXPECT_FALSE(isParagraphBlank(paragraphAt(doc, 1)));

    auto const& box = paragraphAt(doc, 2);
    ASSERT_EQ(box.content().size(), 1u);
    EXPECT_EQ(box.content()[0].kind, ContentKind::TextBox);
    EXPECT_EQ(box.content()[0].text, "boxed");
}

TEST(WordmlReader, RevisionsAndBookmarks) {
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:bookmarkStart w:id="0" w:name="_Toc1"/>)"
        R"(<w:ins w:id="1" w:author="Reviewer"><w:r><w:t>added</w:t></w:r></w:ins>)"
        R"(<w:del w:id="2"><w:r><w:delText>gone</w:delText></w:r></w:del>)"
        R"(<w:bookmarkEnd w:id="0"/></w:p>)"));

    auto const& p = paragraphAt(doc, 0);
    ASSERT_EQ(p.content().size(), 2u);

    auto const& ins = p.content()[0];
    EXPECT_EQ(ins.kind, ContentKind::Revision);
    EXPECT_EQ(ins.revisionType, RevisionType::Insert);
    EXPECT_EQ(ins.author, "Reviewer");
    EXPECT_EQ(ins.plainText(), "added");

    auto const& del = p.content()[1];
    EXPECT_EQ(del.revisionType, RevisionType::Delete);
    EXPECT_EQ(del.plainText(), "gone");

    ASSERT_EQ(p.bookmarksStart().size(), 1u);
    EXPECT_EQ(p.bookmarksStart()[0], "_Toc1");
    ASSERT_EQ(p.bookmarksEnd().size(), 1u);
    EXPECT_EQ(p.bookmarksEnd()[0], "0");
    EXPECT_FALSE(isParagraphBlank(p));
}

TEST(WordmlReader, TablesAndStructuredTags) {
    Document doc = wordml::read(wrapBody(
        R"(<w:sdt><w:sdtContent><w:p><w:r><w:t>wrapped</w:t></w:r></w:p></w:sdtContent></w:sdt>)"
        R"(<w:tbl><w:tblPr/>)"
        R"(<w:tr><w:tc><w:p><w:r><w:t>a</w:t></w:r></w:p><w:p/></w:tc><w:tc/></w:tr>)"
        R"(<w:tr><w:tc><w:tbl><w:tr><w:tc><w:p><w:r><w:t>inner</w:t></w:r></w:p></w:tc></w:tr></w:tbl>)"
        R"(<w:p/></w:tc><w:tc><w:p/></w:tc></w:tr>)"
        R"(</w:tbl>)"));

    ASSERT_EQ(doc.bodyElementCount(), 2u);
    EXPECT_EQ(paragraphAt(doc, 0).text(), "wrapped");

    auto const* table = doc.bodyElementAt(1)->asTable();
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->rowCount(), 2u);
    EXPECT_EQ(table->columnCount(), 2u);
    EXPECT_EQ(table->cellAt(0, 0)->paragraphCount(), 2u);
    // An empty w:tc still yields one paragraph.
    EXPECT_EQ(table->cellAt(0, 1)->paragraphCount(), 1u);
    EXPECT_TRUE(table->cellAt(1, 0)->hasNestedTables());
    EXPECT_EQ(doc.allTables().size(), 2u);
}

TEST(WordmlReader, Styles) {
    Document doc = wordml::read(wrapBody(R"(<w:p><w:pPr><w:pStyle w:val="Quote"/></w:pPr></w:p>)"), kStyles);

    EXPECT_EQ(doc.styles().size(), 3u);
    StyleDefinition const* quote = doc.style("Quote");
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(quote->name, "Quote");
    EXPECT_TRUE(quote->hasIndentation);
    EXPECT_EQ(quote->leftIndent, 864);

    StyleDefinition const* odd = doc.style("Odd");
    ASSERT_NE(odd, nullptr);
    EXPECT_EQ(odd->name, "Odd");
    EXPECT_TRUE(odd->hasIndentation);
    EXPECT_FALSE(odd->leftIndent.has_value());

    EXPECT_EQ(doc.style("Strong"), nullptr);
    EXPECT_FALSE(doc.style("Normal")->hasIndentation);
}

TEST(WordmlReader, MalformedInputThrows) {
    EXPECT_THROW(wordml::read("<w:document"), ParseError);
    EXPECT_THROW(wordml::read("<root/>"), ParseError);
    EXPECT_THROW(wordml::read(wrapBody("<w:p/>"), "<notStyles/>"), ParseError);

    Document doc;
    EXPECT_THROW(wordml::readStyles(doc, "not xml at all <"), ParseError);
}

TEST(WordmlReader, OutOfRangeIntegersThrow) {
    EXPECT_THROW(wordml::read(wrapBody(R"(<w:p><w:pPr><w:ind w:left="99999999999"/></w:pPr></w:p>)")),
                 ParseError);
    EXPECT_THROW(wordml::read(wrapBody(
                     R"(<w:p><w:pPr><w:numPr><w:ilvl w:val="4294967296"/><w:numId w:val="1"/></w:numPr></w:pPr></w:p>)")),
                 ParseError);
    EXPECT_THROW(wordml::read(wrapBody(R"(<w:p><w:pPr><w:spacing w:after="-3000000000"/></w:pPr></w:p>)")),
                 ParseError);

    std::string styles =
        R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
        R"(<w:style w:type="paragraph" w:styleId="Wide"><w:pPr><w:ind w:start="2147483648"/></w:pPr></w:style>)"
        R"(</w:styles>)";
    EXPECT_THROW(wordml::read(wrapBody("<w:p/>"), styles), ParseError);

    // The widest values an int holds still read.
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:pPr><w:ind w:left="2147483647"/><w:spacing w:before="-2147483648"/></w:pPr></w:p>)"));
    EXPECT_EQ(paragraphAt(doc, 0).formatting().leftIndent, 2147483647);
    EXPECT_EQ(paragraphAt(doc, 0).formatting().spaceBefore, -2147483647 - 1);
}

TEST(WordmlWriter, WritesReadableDocument) {
    Document doc;
    doc.addParagraph(Paragraph("Heading")).setStyle("Heading1").setAlignment(Alignment::Center);

    Paragraph item("Line\tone\nLine two");
    item.setNumbering(Numbering{2, 1}).setLeftIndent(1440).setSpaceAfter(120);
    doc.addParagraph(std::move(item));

    Paragraph figure;
    ContentItem picture = ContentItem::imageRun(914400, 457200);
    picture.image.name = "Logo";
    picture.image.relationshipId = "rId3";
    figure.addContent(std::move(picture));
    doc.addParagraph(std::move(figure));

    Paragraph linked;
    linked.addContent(ContentItem::hyperlink("Top", "#_top"));
    linked.addContent(ContentItem::revision(RevisionType::Delete, {ContentItem::run("old")}));
    linked.addBookmarkStart("mark");
    doc.addParagraph(std::move(linked));

    TableCell cell;
    cell.addParagraph(Paragraph("inside"));
    cell.addParagraph(Paragraph{});
    TableRow row;
    row.addCell(std::move(cell));
    Table table;
    table.addRow(std::move(row));
    doc.addTable(std::move(table));

    std::string xml = wordml::write(doc);
    EXPECT_NE(xml.find(wordml::kMainNamespace), std::string::npos);
    EXPECT_NE(xml.find("<w:delText"), std::string::npos);
    EXPECT_NE(xml.find("w:anchor=\"_top\""), std::string::npos);

    Document reread = wordml::read(xml);
    EXPECT_EQ(describe(reread), describe(doc));

    auto const& again = paragraphAt(reread, 1);
    EXPECT_EQ(again.text(), "Line\tone\nLine two");
    EXPECT_EQ(again.formatting().spaceAfter, 120);

    Image const* image = firstImageIn(paragraphAt(reread, 2));
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->relationshipId, "rId3");
    EXPECT_EQ(image->name, "Logo");

    auto const& link = paragraphAt(reread, 3);
    EXPECT_EQ(link.content()[0].target, "#_top");
    EXPECT_EQ(link.content()[1].revisionType, RevisionType::Delete);
    EXPECT_EQ(link.bookmarksStart()[0], "mark");
}

TEST(WordmlWriter, ProcessedDocumentSurvivesRoundTrip) {
    Document doc = wordml::read(wrapBody(
        R"(<w:p><w:r><w:t>Intro</w:t></w:r></w:p>)"
        R"(<w:p><w:pPr><w:pStyle w:val="Heading1"/></w:pPr><w:r><w:t>Section</w:t></w:r></w:p>)"
        R"(<w:p/><w:p/>)"
        R"(<w:p><w:r><w:t>Body</w:t></w:r></w:p>)"));

    removeSmallIndents(doc);
    BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
    BlankLineManager manager;
    manager.processBlankLines(doc, snapshot);

    std::string expected = describe(doc);
    Document reread = wordml::read(wordml::write(doc));
    EXPECT_EQ(describe(reread), expected);

    // Normalized blanks keep their style and spacing through the writer.
    for (std::size_t i = 0; i < reread.bodyElementCount(); ++i) {
        auto const* p = reread.bodyElementAt(i)->asParagraph();
        if (!p || !isParagraphBlank(*p)) continue;
        EXPECT_EQ(p->style(), "Normal");
        EXPECT_EQ(p->formatting().spaceAfter, 120);
    }
}
