#pragma once

#include <QString>

#include <memory>

struct TestSummary {
    int passed = 0;
    int total = 0;
};

// Turns a test runner's combined stdout/stderr into pass/total counts.
// Implementations must be pure: identical text always yields identical counts.
// Output without a recognizable summary is (0, 0), which is a legitimate
// result and not an error.
class OutputSummaryParser {
public:
    virtual ~OutputSummaryParser() = default;
    virtual QString dialect() const = 0;
    virtual TestSummary parse(const QString &output) const = 0;
};

// Python unittest:
//   "Ran 5 tests in 0.002s"  gives the total
//   "FAILED (failures=1, errors=2)"  gives failures and errors
// passed = max(0, total - failures - errors)
class UnittestSummaryParser : public OutputSummaryParser {
public:
    QString dialect() const override { return QStringLiteral("unittest"); }
    TestSummary parse(const QString &output) const override;
};

// pytest's closing line, e.g. "==== 3 passed, 1 failed, 1 error in 0.12s ====".
class PytestSummaryParser : public OutputSummaryParser {
public:
    QString dialect() const override { return QStringLiteral("pytest"); }
    TestSummary parse(const QString &output) const override;
};

// Returns nullptr for an unknown dialect name.
std::unique_ptr<OutputSummaryParser> makeSummaryParser(const QString &dialect);
