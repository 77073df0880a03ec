#include "execution/SummaryParser.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

TestSummary UnittestSummaryParser::parse(const QString &output) const {
    static const QRegularExpression ranPattern("Ran\\s+(\\d+)\\s+tests?");
    static const QRegularExpression failedPattern("FAILED\\s+\\(([^)]+)\\)");

    int total = 0;
    int failures = 0;
    int errors = 0;

    const QRegularExpressionMatch ranMatch = ranPattern.match(output);
    if (ranMatch.hasMatch()) {
        total = ranMatch.captured(1).toInt();
    }

    const QRegularExpressionMatch failMatch = failedPattern.match(output);
    if (failMatch.hasMatch()) {
        const QStringList parts = failMatch.captured(1).split(',');
        for (const QString &rawPart : parts) {
            const QString part = rawPart.trimmed();
            if (part.startsWith("failures=")) {
                failures = part.section('=', 1, 1).toInt();
            } else if (part.startsWith("errors=")) {
                errors = part.section('=', 1, 1).toInt();
            }
        }
    }

    TestSummary summary;
    summary.total = total;
    summary.passed = std::max(0, total - failures - errors);
    return summary;
}

TestSummary PytestSummaryParser::parse(const QString &output) const {
    static const QRegularExpression linePattern("^=+ (.*\\bin [0-9.]+s.*) =+\\s*$",
                                                QRegularExpression::MultilineOption);
    static const QRegularExpression countPattern("(\\d+) (passed|failed|errors?)\\b");

    // The summary is the last "=== ... in Ns ===" line.
    QString summaryLine;
    QRegularExpressionMatchIterator lines = linePattern.globalMatch(output);
    while (lines.hasNext()) {
        summaryLine = lines.next().captured(1);
    }

    int passed = 0;
    int failed = 0;
    QRegularExpressionMatchIterator counts = countPattern.globalMatch(summaryLine);
    while (counts.hasNext()) {
        const QRegularExpressionMatch match = counts.next();
        const int value = match.captured(1).toInt();
        if (match.captured(2) == "passed") {
            passed += value;
        } else {
            failed += value;
        }
    }

    TestSummary summary;
    summary.total = passed + failed;
    summary.passed = passed;
    return summary;
}

std::unique_ptr<OutputSummaryParser> makeSummaryParser(const QString &dialect) {
    const QString normalized = dialect.trimmed().toLower();
    if (normalized.isEmpty() || normalized == "unittest") {
        return std::make_unique<UnittestSummaryParser>();
    }
    if (normalized == "pytest") {
        return std::make_unique<PytestSummaryParser>();
    }
    return nullptr;
}
