#include "execution/ExecutionUtils.h"
#include "execution/SummaryParser.h"
#include "TestSupport.h"

#include <QCoreApplication>

#include <cstdlib>

using TestSupport::check;

namespace {

bool expectCounts(const OutputSummaryParser &parser, const QString &output,
                  int passed, int total, const QString &label) {
    const TestSummary summary = parser.parse(output);
    return check(summary.passed == passed && summary.total == total,
                 QString("%1: expected %2/%3, got %4/%5")
                     .arg(label).arg(passed).arg(total).arg(summary.passed).arg(summary.total));
}

bool testUnittestSummaries() {
    const UnittestSummaryParser parser;
    bool ok = true;
    ok = expectCounts(parser, "...\n------\nRan 3 tests in 0.002s\n\nOK\n", 3, 3, "all passing") && ok;
    ok = expectCounts(parser, "Ran 1 test in 0.000s\n\nOK", 1, 1, "singular test") && ok;
    ok = expectCounts(parser, "Ran 5 tests in 0.010s\n\nFAILED (failures=1, errors=2)\n", 2, 5,
                      "failures and errors") && ok;
    ok = expectCounts(parser, "Ran 4 tests in 0.010s\n\nFAILED (errors=1)\n", 3, 4, "errors only") && ok;
    ok = expectCounts(parser, "Ran 4 tests in 0.01s\n\nFAILED (failures=1, skipped=2)\n", 3, 4,
                      "skipped is not a failure") && ok;
    ok = expectCounts(parser, "Ran 1 test in 0.01s\n\nFAILED (failures=3)\n", 0, 1,
                      "passed never goes negative") && ok;
    return ok;
}

bool testNoSummaryIsZeroZero() {
    const UnittestSummaryParser parser;
    bool ok = true;
    ok = expectCounts(parser, "", 0, 0, "empty output") && ok;
    ok = expectCounts(parser, "Traceback (most recent call last):\nSyntaxError: invalid syntax\n", 0, 0,
                      "crash before tests ran") && ok;
    // A failure line without a Ran line still has nothing to subtract from.
    ok = expectCounts(parser, "FAILED (failures=2)", 0, 0, "failure line only") && ok;
    return ok;
}

bool testParsingIsDeterministic() {
    const UnittestSummaryParser parser;
    const QString output = "Ran 7 tests in 0.3s\nFAILED (failures=2, errors=1)";
    const TestSummary first = parser.parse(output);
    const TestSummary second = parser.parse(output);
    return check(first.passed == second.passed && first.total == second.total && first.passed == 4,
                 "Parsing the same output twice must give the same counts");
}

bool testPytestSummaries() {
    const PytestSummaryParser parser;
    bool ok = true;
    ok = expectCounts(parser, "collected 5 items\n\n"
                              "===== 3 passed, 1 failed, 1 error in 0.12s =====\n", 3, 5,
                      "pytest mixed") && ok;
    ok = expectCounts(parser, "============================== 2 passed in 0.01s ===============================\n",
                      2, 2, "pytest all passing") && ok;
    ok = expectCounts(parser, "no tests here\n", 0, 0, "pytest without summary") && ok;
    return ok;
}

bool testParserFactory() {
    bool ok = true;
    const auto unittest = makeSummaryParser("unittest");
    ok = check(unittest && unittest->dialect() == "unittest", "unittest dialect should resolve") && ok;
    const auto fallback = makeSummaryParser("");
    ok = check(fallback && fallback->dialect() == "unittest", "empty dialect should default to unittest") && ok;
    const auto pytest = makeSummaryParser(" PyTest ");
    ok = check(pytest && pytest->dialect() == "pytest", "pytest dialect should resolve case-insensitively") && ok;
    ok = check(!makeSummaryParser("nose"), "unknown dialect should yield no parser") && ok;
    return ok;
}

bool testOutputTruncation() {
    bool ok = true;
    const QString shortText = "short";
    ok = check(ExecutionUtils::truncateOutput(shortText, 100) == shortText, "Short output must be untouched") && ok;
    const QString longText(1000, 'x');
    const QString truncated = ExecutionUtils::truncateOutput(longText, 100);
    ok = check(truncated.startsWith(QString(100, 'x')) && truncated.contains("[output truncated after 100 bytes]"),
               "Long output should keep its head and carry a marker") && ok;
    // Multi-byte characters must not be split into replacement characters.
    const QString accents(60, QChar(0x00E9));
    const QString cut = ExecutionUtils::truncateOutput(accents, 11);
    ok = check(!cut.contains(QChar::ReplacementCharacter) && cut.startsWith(QString(5, QChar(0x00E9))),
               "Truncation should drop a partially cut character") && ok;
    return ok;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    bool ok = true;
    ok = testUnittestSummaries() && ok;
    ok = testNoSummaryIsZeroZero() && ok;
    ok = testParsingIsDeterministic() && ok;
    ok = testPytestSummaries() && ok;
    ok = testParserFactory() && ok;
    ok = testOutputTruncation() && ok;

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
