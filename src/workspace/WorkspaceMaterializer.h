#pragma once

#include "core/EngineError.h"
#include "question/QuestionConfig.h"

#include <QMap>
#include <QString>
#include <QTemporaryDir>

#include <memory>

// Builds the sandbox image for one execution.
//
// Candidate input can only replace files the question declares editable;
// every other file (hidden tests, fixtures, support modules) is copied from
// the question's own assets. The returned directory is removed when the
// QTemporaryDir is destroyed, so holding it in a unique_ptr scopes it to
// the execution on every exit path.
class WorkspaceMaterializer {
public:
    // scratchRoot is where execution directories are created; empty means
    // the system temporary directory.
    explicit WorkspaceMaterializer(const QString &scratchRoot = QString());

    std::unique_ptr<QTemporaryDir> materialize(const QuestionConfig &config,
                                               const QMap<QString, QString> &candidateFiles,
                                               EngineError *errorOut = nullptr) const;

    // Discards whatever is under root and writes the same image again, so a
    // target cannot leave anything behind for the next one.
    bool restore(const QuestionConfig &config,
                 const QMap<QString, QString> &candidateFiles,
                 const QString &root,
                 EngineError *errorOut = nullptr) const;

    // Drops write permission on every file under root.
    static bool makeReadOnly(const QString &root);

private:
    bool populate(const QuestionConfig &config, const QMap<QString, QString> &candidateFiles,
                  const QString &destination, EngineError *errorOut) const;
    bool writeFile(const QString &path, const QString &content, EngineError *errorOut) const;
    bool copyFixedAssets(const QuestionConfig &config, const QString &destination,
                         EngineError *errorOut) const;

    QString scratchRoot_;
};
