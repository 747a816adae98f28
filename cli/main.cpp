#include "blank_lines.h"
#include "document_source.h"
#include "indentation.h"
#include "log.h"
#include "parse_error.h"
#include "snapshot.h"
#include "wordml.h"

#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

using namespace blankline_cpp;

static void usage(char const* prog) {
    std::cerr << "Usage: " << prog << " [--file <path>] [--html] [--styles <path>] [options]\n"
              << "Reads word/document.xml (or HTML) from stdin or --file, normalizes blank lines\n"
              << "and writes the document XML to stdout.\n"
              << "Options:\n"
              << "  --file <path>                  Read input from file instead of stdin\n"
              << "  --html                         Input is HTML instead of WordprocessingML\n"
              << "  --styles <path>                Read paragraph styles from word/styles.xml\n"
              << "  --list-level L:SYMBOL:TEXT     List level indents in inches (repeatable)\n"
              << "  --space-after <twips>          Space after blank paragraphs (default: 120)\n"
              << "  --space-before <twips>         Space before blank paragraphs\n"
              << "  --line-spacing <twips>         Line spacing of blank paragraphs\n"
              << "  --font-size <points>           Font size of blank paragraphs\n"
              << "  --font <family>                Font family of blank paragraphs\n"
              << "  --stop-bold-colon-after <text> Heading after which bold labels get no blank below\n"
              << "  --dump                         Write an outline instead of XML\n"
              << "  --verbose                      Log rule matches to stderr\n"
              << "  --help                         Show this help\n";
}

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// "L:SYMBOL:TEXT", e.g. "0:0.25:0.5"
static ListLevelSetting parse_list_level(std::string const& spec) {
    std::size_t first = spec.find(':');
    std::size_t second = first == std::string::npos ? std::string::npos : spec.find(':', first + 1);
    if (second == std::string::npos) {
        throw std::invalid_argument("--list-level expects L:SYMBOL:TEXT, got '" + spec + "'");
    }
    ListLevelSetting setting;
    setting.level = std::stoi(spec.substr(0, first));
    setting.symbolIndent = std::stod(spec.substr(first + 1, second - first - 1));
    setting.textIndent = std::stod(spec.substr(second + 1));
    return setting;
}

int main(int argc, char** argv) {
    std::string filePath;
    std::string stylesPath;
    bool asHtml = false;
    bool dump = false;
    BlankLineOptions opts;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                usage(argv[0]);
                return 0;
            } else if (arg == "--file" && i + 1 < argc) {
                filePath = argv[++i];
            } else if (arg == "--html") {
                asHtml = true;
            } else if (arg == "--styles" && i + 1 < argc) {
                stylesPath = argv[++i];
            } else if (arg == "--list-level" && i + 1 < argc) {
                if (!opts.listBulletSettings) opts.listBulletSettings = ListBulletSettings{};
                opts.listBulletSettings->indentationLevels.push_back(parse_list_level(argv[++i]));
            } else if (arg == "--space-after" && i + 1 < argc) {
                opts.normalStyleFormatting.spaceAfter = std::stoi(argv[++i]);
            } else if (arg == "--space-before" && i + 1 < argc) {
                opts.normalStyleFormatting.spaceBefore = std::stoi(argv[++i]);
            } else if (arg == "--line-spacing" && i + 1 < argc) {
                opts.normalStyleFormatting.lineSpacing = std::stoi(argv[++i]);
            } else if (arg == "--font-size" && i + 1 < argc) {
                opts.normalStyleFormatting.fontSize = std::stod(argv[++i]);
            } else if (arg == "--font" && i + 1 < argc) {
                opts.normalStyleFormatting.fontFamily = argv[++i];
            } else if (arg == "--stop-bold-colon-after" && i + 1 < argc) {
                opts.stopBoldColonAfterHeading = argv[++i];
            } else if (arg == "--dump") {
                dump = true;
            } else if (arg == "--verbose") {
                setLogLevel(spdlog::level::debug);
            } else {
                usage(argv[0]);
                return 1;
            }
        }
    } catch (std::logic_error const& e) {
        // std::stoi/std::stod report bad numbers as invalid_argument/out_of_range.
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    try {
        std::unique_ptr<DocumentSource> source;
        if (!filePath.empty()) {
            source = openSource(filePath, asHtml, stylesPath);
        } else {
            std::string input = read_all(std::cin);
            std::string styles = stylesPath.empty() ? std::string{} : readFile(stylesPath);
            if (asHtml) {
                source = std::make_unique<HtmlSource>(std::move(input));
            } else {
                source = std::make_unique<WordmlSource>(std::move(input), std::move(styles));
            }
        }

        Document doc = source->load();

        removeSmallIndents(doc);
        BlankLineSnapshot snapshot = captureBlankLineSnapshot(doc);
        BlankLineManager manager(opts);
        RuleEngineResult result = manager.processBlankLines(doc, snapshot);

        std::cout << (dump ? describe(doc) : wordml::write(doc));
        std::cerr << "removed=" << result.removed
                  << " added=" << result.added
                  << " preserved=" << result.preserved
                  << " indentationFixed=" << result.indentationFixed << "\n";
    } catch (ParseError const& e) {
        std::cerr << "Parse error: " << e.what() << "\n";
        return 1;
    } catch (std::exception const& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
