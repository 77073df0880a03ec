#pragma once

#include "core/EngineError.h"
#include "execution/TestTargetRunner.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

namespace TestSupport {

inline bool check(bool condition, const QString &message) {
    if (!condition) {
        qCritical().noquote() << message;
        return false;
    }
    return true;
}

inline bool writeTextFile(const QString &root, const QString &relativePath, const QByteArray &content) {
    const QString path = QDir(root).filePath(relativePath);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

inline QString readTextFile(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

// Writes <questionsRoot>/<name>/question.json plus the given files.
inline bool writeQuestion(const QString &questionsRoot, const QString &name, const QByteArray &questionJson,
                          const QMap<QString, QByteArray> &files) {
    const QString root = QDir(questionsRoot).filePath(name);
    if (!writeTextFile(root, "question.json", questionJson)) {
        return false;
    }
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        if (!writeTextFile(root, it.key(), it.value())) {
            return false;
        }
    }
    return true;
}

inline RunResult passingRun(int passed, int total) {
    RunResult result;
    result.exitCode = passed == total ? 0 : 1;
    result.passedCount = passed;
    result.totalCount = total;
    result.rawOutput = QString("Ran %1 tests in 0.001s\n").arg(total);
    return result;
}

// Scripted TestTargetRunner. Each target maps to a RunResult or to a hard
// failure; unknown targets fail with Internal. Calls are recorded in order.
class FakeRunner : public TestTargetRunner {
public:
    void setResult(const QString &target, const RunResult &result) {
        results_.insert(target, result);
        failures_.remove(target);
    }

    void setFailure(const QString &target, EngineError::Kind kind, const QString &message) {
        EngineError error;
        setError(&error, kind, message);
        failures_.insert(target, error);
        results_.remove(target);
    }

    std::optional<RunResult> run(const QString &sandboxRoot, const QString &testTarget,
                                 EngineError *errorOut = nullptr) const override {
        calls_ << testTarget;
        roots_ << sandboxRoot;
        if (results_.contains(testTarget)) {
            return results_.value(testTarget);
        }
        const EngineError failure = failures_.value(
            testTarget, EngineError{EngineError::Kind::Internal, "no scripted result for " + testTarget});
        setError(errorOut, failure.kind, failure.message);
        return std::nullopt;
    }

    QStringList calls() const { return calls_; }
    QStringList roots() const { return roots_; }
    void clearCalls() const {
        calls_.clear();
        roots_.clear();
    }

private:
    QHash<QString, RunResult> results_;
    QHash<QString, EngineError> failures_;
    mutable QStringList calls_;
    mutable QStringList roots_;
};

} // namespace TestSupport
