#include "workspace/WorkspaceMaterializer.h"
#include "workspace/PathGuard.h"
#include "question/QuestionRepository.h"
#include "core/Logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QStringConverter>
#include <QTextStream>

WorkspaceMaterializer::WorkspaceMaterializer(const QString &scratchRoot)
    : scratchRoot_(scratchRoot) {}

bool WorkspaceMaterializer::writeFile(const QString &path, const QString &content,
                                      EngineError *errorOut) const {
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to create directory for %1").arg(path));
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to write %1: %2").arg(path, file.errorString()));
        return false;
    }
    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out << content;
    out.flush();
    if (out.status() != QTextStream::Ok) {
        setError(errorOut, EngineError::Kind::Internal, QString("Short write to %1").arg(path));
        return false;
    }
    return true;
}

bool WorkspaceMaterializer::copyFixedAssets(const QuestionConfig &config,
                                            const QString &destination,
                                            EngineError *errorOut) const {
    const QDir root(config.rootPath);
    QDirIterator it(config.rootPath, QDir::Files | QDir::NoSymLinks | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString sourcePath = it.next();
        const QString relativePath = root.relativeFilePath(sourcePath);
        if (relativePath == QuestionRepository::kConfigFile) {
            continue;
        }
        // Editable files were already written from the submission or stock copy.
        if (config.isCandidateEditable(relativePath)) {
            continue;
        }
        const QString target = QDir(destination).filePath(relativePath);
        if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
            setError(errorOut, EngineError::Kind::Internal,
                     QString("Failed to create directory for %1").arg(relativePath));
            return false;
        }
        if (!QFile::copy(sourcePath, target)) {
            setError(errorOut, EngineError::Kind::Internal,
                     QString("Failed to copy question asset %1").arg(relativePath));
            return false;
        }
    }
    return true;
}

std::unique_ptr<QTemporaryDir> WorkspaceMaterializer::materialize(
    const QuestionConfig &config,
    const QMap<QString, QString> &candidateFiles,
    EngineError *errorOut) const {
    const QString base = scratchRoot_.isEmpty() ? QDir::tempPath() : scratchRoot_;
    QDir().mkpath(base);
    auto workspace = std::make_unique<QTemporaryDir>(QDir(base).filePath("pairbench-XXXXXX"));
    if (!workspace->isValid()) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to create workspace directory: %1").arg(workspace->errorString()));
        return nullptr;
    }
    if (!populate(config, candidateFiles, workspace->path(), errorOut)) {
        return nullptr;
    }
    qCDebug(lcWorkspace) << "Materialized" << config.name << "into" << workspace->path();
    return workspace;
}

bool WorkspaceMaterializer::populate(const QuestionConfig &config,
                                     const QMap<QString, QString> &candidateFiles,
                                     const QString &destination,
                                     EngineError *errorOut) const {
    for (const QString &relativePath : config.candidateEditableFiles) {
        const auto target = PathGuard::resolveInside(destination, relativePath, errorOut);
        if (!target) {
            qCWarning(lcWorkspace) << "Question" << config.name
                                   << "declares an editable path outside the sandbox:" << relativePath;
            return false;
        }

        QString content;
        bool haveContent = false;
        const auto submitted = candidateFiles.constFind(relativePath);
        if (submitted != candidateFiles.constEnd()) {
            content = submitted.value();
            haveContent = true;
        } else if (const auto stock = PathGuard::resolveInside(config.rootPath, relativePath)) {
            QFile file(*stock);
            if (file.open(QIODevice::ReadOnly)) {
                content = QString::fromUtf8(file.readAll());
                haveContent = true;
            }
        }
        if (!haveContent) {
            continue;
        }
        if (!writeFile(*target, content, errorOut)) {
            return false;
        }
    }

    for (auto it = candidateFiles.constBegin(); it != candidateFiles.constEnd(); ++it) {
        if (!config.isCandidateEditable(it.key())) {
            qCDebug(lcWorkspace) << "Ignoring submitted file that is not editable:" << it.key();
        }
    }

    return copyFixedAssets(config, destination, errorOut);
}

bool WorkspaceMaterializer::restore(const QuestionConfig &config,
                                    const QMap<QString, QString> &candidateFiles,
                                    const QString &root,
                                    EngineError *errorOut) const {
    // A previous target may have locked directories against removal.
    QFile::setPermissions(root, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    QDirIterator dirs(root, QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::NoSymLinks,
                      QDirIterator::Subdirectories);
    while (dirs.hasNext()) {
        QFile::setPermissions(dirs.next(),
                              QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    }

    QDir dir(root);
    if (!dir.removeRecursively() || !QDir().mkpath(root)) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to reset workspace %1").arg(root));
        return false;
    }
    return populate(config, candidateFiles, root, errorOut);
}

bool WorkspaceMaterializer::makeReadOnly(const QString &root) {
    bool ok = true;
    QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        ok = QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::ReadGroup |
                                             QFileDevice::ReadOther) && ok;
    }
    return ok;
}
