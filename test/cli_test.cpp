// blankline_cpp/test/cli_test.cpp
#include <gtest/gtest.h>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#ifndef BLANKLINE_CLI_PATH
#error "BLANKLINE_CLI_PATH is not defined"
#endif

namespace {

struct CliResult {
    std::string output;
    int exitCode = -1;
};

enum class Capture {
    Stdout,
    Stderr
};

std::string writeTemp(std::string const& data) {
    char tmpl[] = "/tmp/blankline_cli_inputXXXXXX";
    int fd = mkstemp(tmpl);
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    auto const written = write(fd, data.data(), data.size());
    close(fd);
    if (written != static_cast<ssize_t>(data.size())) {
        unlink(tmpl);
        throw std::runtime_error("Failed to write temp file");
    }
    return tmpl;
}

CliResult runCli(std::vector<std::string> const& args, std::string const& stdinData,
                 Capture capture = Capture::Stdout) {
    std::string tempPath;
    std::string cmd = "'";
    cmd += BLANKLINE_CLI_PATH;
    cmd += "'";
    for (auto const& a : args) {
        cmd.push_back(' ');
        cmd += a;
    }
    if (!stdinData.empty()) {
        tempPath = writeTemp(stdinData);
        cmd += " < '" + tempPath + "'";
    } else {
        cmd += " < /dev/null";
    }
    cmd += capture == Capture::Stdout ? " 2>/dev/null" : " 2>&1 >/dev/null";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        if (!tempPath.empty()) {
            unlink(tempPath.c_str());
        }
        throw std::runtime_error(std::string("Failed to run CLI: ") + std::strerror(errno) + " (" + cmd + ")");
    }
    CliResult result;
    char buf[256];
    while (fgets(buf, sizeof(buf), pipe)) {
        result.output += buf;
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    if (!tempPath.empty()) {
        unlink(tempPath.c_str());
    }
    return result;
}

std::string wordml(std::string const& body) {
    return R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
           "<w:body>" + body + "</w:body></w:document>";
}

std::string const kHeadingAndList = wordml(
    R"(<w:p><w:pPr><w:pStyle w:val="Heading1"/></w:pPr><w:r><w:t>Intro</w:t></w:r></w:p>)"
    R"(<w:p><w:r><w:t>line A</w:t></w:r></w:p>)"
    R"(<w:p><w:pPr><w:numPr><w:ilvl w:val="0"/><w:numId w:val="1"/></w:numPr></w:pPr><w:r><w:t>a</w:t></w:r></w:p>)"
    R"(<w:p><w:pPr><w:numPr><w:ilvl w:val="0"/><w:numId w:val="1"/></w:numPr></w:pPr><w:r><w:t>b</w:t></w:r></w:p>)"
    R"(<w:p><w:r><w:t>line B</w:t></w:r></w:p>)");

TEST(CliTests, DumpsProcessedDocument) {
    CliResult result = runCli({"--dump"}, kHeadingAndList);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output,
              "P[Heading1] \"Intro\"\n"
              "(blank)\n"
              "P \"line A\"\n"
              "P #1.0 \"a\"\n"
              "P #1.0 \"b\"\n"
              "(blank)\n"
              "P \"line B\"\n");
}

TEST(CliTests, WritesDocumentXml) {
    CliResult result = runCli({}, kHeadingAndList);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("<w:document"), std::string::npos);
    EXPECT_NE(result.output.find("wordprocessingml/2006/main"), std::string::npos);
    EXPECT_NE(result.output.find(">line B</w:t>"), std::string::npos);
}

TEST(CliTests, ReportsCountsOnStderr) {
    CliResult result = runCli({"--dump"}, kHeadingAndList, Capture::Stderr);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("removed=0 added=2"), std::string::npos) << result.output;
}

TEST(CliTests, ReadsHtmlFromFile) {
    std::string path = writeTemp("<h1>Intro</h1><p>line A</p>");
    CliResult result = runCli({"--html", "--dump", "--file", "'" + path + "'"}, "");
    unlink(path.c_str());

    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output,
              "P[Heading1] \"Intro\"\n"
              "(blank)\n"
              "P \"line A\"\n");
}

TEST(CliTests, AppliesListLevels) {
    std::string input = wordml(
        R"(<w:p><w:pPr><w:numPr><w:ilvl w:val="0"/><w:numId w:val="1"/></w:numPr></w:pPr><w:r><w:t>a</w:t></w:r></w:p>)"
        R"(<w:p/>)"
        R"(<w:p><w:pPr><w:ind w:left="1000"/></w:pPr><w:r><w:t>continued</w:t></w:r></w:p>)");

    CliResult result = runCli({"--dump", "--list-level", "0:0.25:0.5"}, input);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output,
              "P #1.0 \"a\"\n"
              "P >720 \"continued\"\n");
}

TEST(CliTests, HelpGoesToStderr) {
    CliResult result = runCli({"--help"}, "", Capture::Stderr);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("Usage:"), std::string::npos);
}

TEST(CliTests, RejectsUnknownOption) {
    CliResult result = runCli({"--bogus"}, "", Capture::Stderr);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_NE(result.output.find("Usage:"), std::string::npos);
}

TEST(CliTests, RejectsBadNumber) {
    CliResult result = runCli({"--space-after", "lots"}, "", Capture::Stderr);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_NE(result.output.find("Error:"), std::string::npos);

    result = runCli({"--list-level", "0-0.25"}, "", Capture::Stderr);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_NE(result.output.find("L:SYMBOL:TEXT"), std::string::npos);
}

TEST(CliTests, MalformedInputFails) {
    CliResult result = runCli({"--dump"}, "<w:document", Capture::Stderr);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_NE(result.output.find("Parse error"), std::string::npos);

    CliResult missing = runCli({"--file", "/nonexistent/blankline_input.xml"}, "", Capture::Stderr);
    EXPECT_EQ(missing.exitCode, 1);
}

} // namespace
