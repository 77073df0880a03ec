#pragma once

#include "core/EngineError.h"

#include <QDir>
#include <QFileInfo>
#include <QString>

#include <optional>

namespace PathGuard {

// Normalizes a candidate-supplied relative path. Returns an empty string for
// anything that is absolute or that climbs out of its root; callers treat
// that as a WorkspaceEscape and stop.
inline QString normalizeRelative(const QString &relativePath) {
    if (relativePath.isEmpty()) {
        return QString();
    }
    QString path = relativePath;
    path.replace('\\', '/');

    // Reject absolute paths, including Windows drive letters (e.g. C:/)
    if (path.startsWith('/') || (path.length() >= 2 && path[1] == ':')) {
        return QString();
    }

    const QString cleaned = QDir::cleanPath(path);
    if (cleaned == "." || cleaned == ".." || cleaned.startsWith("../")) {
        return QString();
    }
    return cleaned;
}

inline bool isInside(const QString &root, const QString &path) {
    return path == root || path.startsWith(root + '/');
}

// Resolves relativePath under root. Fails closed with WorkspaceEscape when
// the result, or the target an existing symlink points at, leaves root.
inline std::optional<QString> resolveInside(const QString &root,
                                            const QString &relativePath,
                                            EngineError *errorOut = nullptr) {
    const QString escapeMessage = QString("Path escapes workspace: %1").arg(relativePath);
    const QString normalized = normalizeRelative(relativePath);
    if (normalized.isEmpty()) {
        setError(errorOut, EngineError::Kind::WorkspaceEscape, escapeMessage);
        return std::nullopt;
    }

    const QString absoluteRoot = QDir::cleanPath(QDir(root).absolutePath());
    const QString resolved = QDir::cleanPath(QDir(absoluteRoot).filePath(normalized));
    if (!isInside(absoluteRoot, resolved)) {
        setError(errorOut, EngineError::Kind::WorkspaceEscape, escapeMessage);
        return std::nullopt;
    }

    const QFileInfo info(resolved);
    if (info.exists() || info.isSymLink()) {
        const QString canonicalRoot = QFileInfo(absoluteRoot).canonicalFilePath();
        const QString canonical = info.canonicalFilePath();
        if (canonical.isEmpty() || !isInside(canonicalRoot, canonical)) {
            setError(errorOut, EngineError::Kind::WorkspaceEscape, escapeMessage);
            return std::nullopt;
        }
    }
    return resolved;
}

} // namespace PathGuard
