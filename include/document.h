/// @file document.h
/// @brief In-memory paragraph/table document tree
///
/// This is the host tree the blank-line engine mutates. The body is an
/// ordered sequence of elements, each either a Paragraph or a Table. A
/// table is made of rows, rows of cells, and every cell owns an ordered
/// list of blocks (paragraphs and nested tables). Paragraphs own their
/// content items: text runs, image runs, hyperlinks, fields, shapes, text
/// boxes and tracked-change revisions wrapping further items.
///
/// Elements are owned through std::unique_ptr so that raw pointers handed
/// out by the accessors stay valid while siblings are inserted or removed.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_DOCUMENT_H
#define BLANKLINE_CPP_DOCUMENT_H

#include "document_concepts.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blankline_cpp {

class Paragraph;
class Table;

/// @enum ElementKind
/// @brief Kind of a body or cell element
enum class ElementKind {
    Paragraph,
    Table
};

/// @enum Alignment
/// @brief Horizontal paragraph alignment (w:jc)
enum class Alignment {
    Left,
    Center,
    Right,
    Both
};

/// @enum ContentKind
/// @brief Kind of a paragraph content item
enum class ContentKind {
    Run,
    ImageRun,
    Hyperlink,
    Field,
    Shape,
    TextBox,
    Revision
};

/// @enum RevisionType
/// @brief Tracked change type of a revision wrapper
enum class RevisionType {
    Insert,
    Delete
};

/// @struct RunFormatting
/// @brief Character formatting of a run (w:rPr subset)
struct RunFormatting {
    bool bold = false;
    bool italic = false;
    std::optional<double> fontSize;          ///< Points
    std::optional<std::string> fontFamily;
};

/// @struct Image
/// @brief Inline image extents in EMU
struct Image {
    std::int64_t widthEmu = 0;
    std::int64_t heightEmu = 0;
    std::string name;
    std::string relationshipId;

    std::int64_t width() const { return widthEmu; }
    std::int64_t height() const { return heightEmu; }
};

/// @struct ContentItem
/// @brief One item of paragraph content
///
/// A tagged record rather than a class hierarchy: the fields that matter
/// depend on @ref kind.
///
/// | kind      | fields used                                   |
/// |-----------|-----------------------------------------------|
/// | Run       | text, formatting                              |
/// | ImageRun  | image, formatting                             |
/// | Hyperlink | text (display), target (url, anchor or r:id)  |
/// | Field     | target (instruction), text (cached result)    |
/// | Shape     | (none)                                        |
/// | TextBox   | text                                          |
/// | Revision  | revisionType, author, children                |
struct ContentItem {
    ContentKind kind = ContentKind::Run;
    std::string text;
    RunFormatting formatting;
    Image image;
    std::string target;
    RevisionType revisionType = RevisionType::Insert;
    std::string author;
    std::vector<ContentItem> children;

    static ContentItem run(std::string text, RunFormatting formatting = {});
    static ContentItem boldRun(std::string text);
    static ContentItem imageRun(std::int64_t widthEmu, std::int64_t heightEmu);
    static ContentItem hyperlink(std::string text, std::string target = {});
    static ContentItem field(std::string instruction, std::string result = {});
    static ContentItem shape();
    static ContentItem textBox(std::string text);
    static ContentItem revision(RevisionType type, std::vector<ContentItem> children);

    /// @brief Text of a run, hyperlink or field, or the concatenated text
    ///        of a revision's children. Images, shapes and text boxes yield "".
    std::string plainText() const;
};

/// @struct Numbering
/// @brief List membership of a paragraph (w:numPr)
struct Numbering {
    int numId = 0;
    int level = 0;
};

/// @struct ParagraphFormatting
/// @brief Direct paragraph formatting (w:pPr subset), values in twips
struct ParagraphFormatting {
    Alignment alignment = Alignment::Left;
    std::optional<int> leftIndent;
    std::optional<int> spaceBefore;
    std::optional<int> spaceAfter;
    std::optional<int> lineSpacing;
};

/// @class Element
/// @brief Common base of body and cell elements
class Element {
public:
    virtual ~Element() = default;

    virtual ElementKind kind() const = 0;
    virtual std::unique_ptr<Element> clone() const = 0;

    bool isParagraph() const { return kind() == ElementKind::Paragraph; }
    bool isTable() const { return kind() == ElementKind::Table; }

    Paragraph* asParagraph();
    Paragraph const* asParagraph() const;
    Table* asTable();
    Table const* asTable() const;

protected:
    Element() = default;
    Element(Element const&) = default;
    Element& operator=(Element const&) = default;
};

/// @class Paragraph
/// @brief A paragraph with content, style, numbering and formatting
class Paragraph final : public Element {
public:
    Paragraph() = default;

    /// @brief Create a paragraph holding one plain run
    explicit Paragraph(std::string text);

    ElementKind kind() const override { return ElementKind::Paragraph; }
    std::unique_ptr<Element> clone() const override;

    std::vector<ContentItem> const& content() const { return content_; }
    std::vector<ContentItem>& content() { return content_; }
    Paragraph& addContent(ContentItem item);

    /// @brief Text of the direct runs, hyperlinks and fields
    ///
    /// Revision-wrapped content is not included, matching how the host
    /// library reports paragraph text.
    std::string text() const;

    std::string const& style() const { return style_; }
    Paragraph& setStyle(std::string style);

    std::optional<Numbering> const& numbering() const { return numbering_; }
    Paragraph& setNumbering(std::optional<Numbering> numbering);

    ParagraphFormatting const& formatting() const { return formatting_; }
    Alignment alignment() const { return formatting_.alignment; }
    Paragraph& setAlignment(Alignment alignment);
    Paragraph& setLeftIndent(int twips);
    Paragraph& setSpaceBefore(int twips);
    Paragraph& setSpaceAfter(int twips);
    Paragraph& setLineSpacing(int twips);

    /// @brief Formatting of the paragraph mark (w:pPr/w:rPr)
    RunFormatting const& markFormatting() const { return markFormatting_; }
    RunFormatting& markFormatting() { return markFormatting_; }

    std::vector<std::string> const& bookmarksStart() const { return bookmarksStart_; }
    std::vector<std::string> const& bookmarksEnd() const { return bookmarksEnd_; }
    Paragraph& addBookmarkStart(std::string name);
    Paragraph& addBookmarkEnd(std::string name);

    /// @brief Protected paragraphs (live TOC fields, engine-created blanks)
    bool isPreserved() const { return preserved_; }
    Paragraph& setPreserved(bool preserved);

private:
    std::vector<ContentItem> content_;
    std::string style_;
    std::optional<Numbering> numbering_;
    ParagraphFormatting formatting_;
    RunFormatting markFormatting_;
    std::vector<std::string> bookmarksStart_;
    std::vector<std::string> bookmarksEnd_;
    bool preserved_ = false;
};

/// @class TableCell
/// @brief A cell owning paragraphs and, possibly, nested tables
///
/// Paragraph accessors index paragraphs only, skipping nested tables.
class TableCell {
public:
    TableCell() = default;
    TableCell(TableCell const& other);
    TableCell& operator=(TableCell const& other);
    TableCell(TableCell&&) noexcept = default;
    TableCell& operator=(TableCell&&) noexcept = default;
    ~TableCell() = default;

    std::vector<std::unique_ptr<Element>> const& blocks() const { return blocks_; }

    std::size_t paragraphCount() const;
    Paragraph* paragraphAt(std::size_t index);
    Paragraph const* paragraphAt(std::size_t index) const;
    std::vector<Paragraph*> paragraphs();
    std::vector<Paragraph const*> paragraphs() const;

    TableCell& addParagraph(Paragraph paragraph);
    TableCell& addTable(Table table);

    /// @brief Insert before the paragraph currently at @p index
    ///        (index == paragraphCount() appends)
    /// @throws std::out_of_range when index > paragraphCount()
    void insertParagraphAt(std::size_t index, Paragraph paragraph);

    /// @throws std::out_of_range when index >= paragraphCount()
    void removeParagraphAt(std::size_t index);

    bool hasNestedTables() const;

    /// @brief Paragraph texts joined with a single space
    std::string text() const;

private:
    std::size_t blockIndexOfParagraph(std::size_t index) const;

    std::vector<std::unique_ptr<Element>> blocks_;
};

/// @class TableRow
/// @brief An ordered sequence of cells
class TableRow {
public:
    std::vector<TableCell> const& cells() const { return cells_; }
    std::vector<TableCell>& cells() { return cells_; }
    std::size_t cellCount() const { return cells_.size(); }
    TableRow& addCell(TableCell cell);

private:
    std::vector<TableCell> cells_;
};

/// @class Table
/// @brief A table of rows and cells
class Table final : public Element {
public:
    Table() = default;

    ElementKind kind() const override { return ElementKind::Table; }
    std::unique_ptr<Element> clone() const override;

    std::vector<TableRow> const& rows() const { return rows_; }
    std::vector<TableRow>& rows() { return rows_; }
    Table& addRow(TableRow row);

    std::size_t rowCount() const { return rows_.size(); }

    /// @brief Widest row's cell count
    std::size_t columnCount() const;

    /// @brief Cell lookup that tolerates ragged or empty tables
    /// @return nullptr when the row or column does not exist
    TableCell* cellAt(std::size_t row, std::size_t column) noexcept;
    TableCell const* cellAt(std::size_t row, std::size_t column) const noexcept;

    bool is1x1() const { return rowCount() == 1 && columnCount() == 1; }
    bool isLargerThan1x1() const { return rowCount() > 1 || columnCount() > 1; }

private:
    std::vector<TableRow> rows_;
};

/// @struct StyleDefinition
/// @brief Paragraph style properties the engine cares about
struct StyleDefinition {
    std::string id;
    std::string name;
    /// True when the style carries a w:ind element, even if its value
    /// could not be resolved.
    bool hasIndentation = false;
    std::optional<int> leftIndent;
};

/// @class Document
/// @brief Owner of the body element sequence and the style table
class Document {
public:
    Document() = default;
    Document(Document const& other);
    Document& operator=(Document const& other);
    Document(Document&&) noexcept = default;
    Document& operator=(Document&&) noexcept = default;
    ~Document() = default;

    std::size_t bodyElementCount() const { return body_.size(); }

    /// @throws std::out_of_range for an invalid index
    Element* bodyElementAt(std::size_t index);
    Element const* bodyElementAt(std::size_t index) const;

    /// @throws std::out_of_range when index > bodyElementCount()
    void insertBodyElementAt(std::size_t index, std::unique_ptr<Element> element);

    /// @throws std::out_of_range for an invalid index
    void removeBodyElementAt(std::size_t index);

    Paragraph& addParagraph(Paragraph paragraph);
    Table& addTable(Table table);

    /// @brief Every table in document order, nested tables included
    ///        (depth-first, a nested table follows its parent)
    std::vector<Table*> allTables();
    std::vector<Table const*> allTables() const;

    void addStyle(StyleDefinition style);
    StyleDefinition const* style(std::string const& id) const;
    std::map<std::string, StyleDefinition> const& styles() const { return styles_; }

private:
    std::vector<std::unique_ptr<Element>> body_;
    std::map<std::string, StyleDefinition> styles_;
};

/// @brief Deterministic outline of the tree, one line per element
///
/// Used to compare trees structurally and by the CLI --dump mode.
/// Body paragraphs render as `P[style]{#num.lvl}{>indent} "text"`, blanks
/// as `(blank)`, tables as `T rows x cols` followed by indented cells.
std::string describe(Document const& document);

static_assert(host::ImageLike<Image>, "Image must satisfy ImageLike");
static_assert(host::ParagraphLike<Paragraph>, "Paragraph must satisfy ParagraphLike");
static_assert(host::TableCellLike<TableCell, Paragraph>, "TableCell must satisfy TableCellLike");
static_assert(host::TableLike<Table, TableCell>, "Table must satisfy TableLike");
static_assert(host::DocumentLike<Document, Element>, "Document must satisfy DocumentLike");

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_DOCUMENT_H
