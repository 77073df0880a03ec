#include "workspace/QuestionWorkspace.h"
#include "workspace/PathGuard.h"
#include "core/Logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

QuestionWorkspace::QuestionWorkspace(const QString &root)
    : root_(QDir::cleanPath(QDir(root).absolutePath())) {}

QStringList QuestionWorkspace::listFiles() const {
    const QDir root(root_);
    QStringList files;
    QDirIterator it(root_, QDir::Files | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files << root.relativeFilePath(it.next());
    }
    files.sort();
    return files;
}

std::optional<QString> QuestionWorkspace::readFile(const QString &relativePath,
                                                   EngineError *errorOut) const {
    const auto path = PathGuard::resolveInside(root_, relativePath, errorOut);
    if (!path) {
        return std::nullopt;
    }
    QFile file(*path);
    if (!file.exists()) {
        setError(errorOut, EngineError::Kind::NotFound, QString("File not found: %1").arg(relativePath));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to read %1: %2").arg(relativePath, file.errorString()));
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll());
}

std::optional<QString> QuestionWorkspace::readDescription(int level, EngineError *errorOut) const {
    const QString fileName = level <= 1 ? QStringLiteral("desc.md")
                                        : QString("desc_level%1.md").arg(level);
    return readFile(fileName, errorOut);
}

bool QuestionWorkspace::writeFile(const QString &relativePath, const QString &content,
                                  EngineError *errorOut) {
    const auto path = PathGuard::resolveInside(root_, relativePath, errorOut);
    if (!path) {
        return false;
    }
    QDir().mkpath(QFileInfo(*path).absolutePath());
    QSaveFile file(*path);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to write %1: %2").arg(relativePath, file.errorString()));
        return false;
    }
    file.write(content.toUtf8());
    if (!file.commit()) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to write %1: %2").arg(relativePath, file.errorString()));
        return false;
    }
    return true;
}

bool QuestionWorkspace::applyPatch(const QString &relativePath, const QString &oldText,
                                   const QString &newText, EngineError *errorOut) {
    const std::optional<QString> content = readFile(relativePath, errorOut);
    if (!content) {
        return false;
    }
    const qsizetype matches = oldText.isEmpty() ? 0 : content->count(oldText);
    if (matches != 1) {
        setError(errorOut, EngineError::Kind::InvalidRequest,
                 QString("Patch requires exactly one match in %1, found %2.")
                     .arg(relativePath).arg(matches));
        return false;
    }
    QString updated = *content;
    updated.replace(updated.indexOf(oldText), oldText.size(), newText);
    if (!writeFile(relativePath, updated, errorOut)) {
        return false;
    }
    qCDebug(lcWorkspace) << "Patched" << relativePath;
    return true;
}

QMap<QString, QString> QuestionWorkspace::snapshot() const {
    QMap<QString, QString> files;
    const QStringList names = listFiles();
    for (const QString &name : names) {
        if (const auto content = readFile(name)) {
            files.insert(name, *content);
        }
    }
    return files;
}
