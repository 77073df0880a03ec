#pragma once

#include "core/EngineError.h"

#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

// File tools over one rooted directory: the candidate's working copy that
// the collaboration layer reads and patches. Every path is resolved through
// PathGuard and fails closed on escape.
class QuestionWorkspace {
public:
    explicit QuestionWorkspace(const QString &root);

    QString root() const { return root_; }

    QStringList listFiles() const;
    std::optional<QString> readFile(const QString &relativePath, EngineError *errorOut = nullptr) const;

    // Level 1 reads desc.md, level N reads desc_levelN.md.
    std::optional<QString> readDescription(int level, EngineError *errorOut = nullptr) const;

    // Replaces exactly one occurrence of oldText; zero or several matches are rejected.
    bool applyPatch(const QString &relativePath, const QString &oldText, const QString &newText,
                    EngineError *errorOut = nullptr);

    bool writeFile(const QString &relativePath, const QString &content, EngineError *errorOut = nullptr);

    // Contents of every file, keyed by relative path, as submitted for execution.
    QMap<QString, QString> snapshot() const;

private:
    QString root_;
};
