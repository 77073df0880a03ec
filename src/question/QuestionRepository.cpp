#include "question/QuestionRepository.h"
#include "core/Logging.h"
#include "workspace/PathGuard.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

namespace {

QStringList stringList(const QJsonValue &value) {
    QStringList result;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &item : array) {
        if (item.isString()) {
            result << item.toString();
        }
    }
    return result;
}

QMap<QString, QString> stringMap(const QJsonValue &value) {
    QMap<QString, QString> result;
    const QJsonObject object = value.toObject();
    for (auto it = object.begin(); it != object.end(); ++it) {
        result.insert(it.key(), it.value().toVariant().toString());
    }
    return result;
}

} // namespace

QuestionRepository::QuestionRepository(const QString &questionsRoot)
    : questionsRoot_(QDir(questionsRoot).absolutePath()) {}

bool QuestionRepository::isSafeQuestionName(const QString &questionName) {
    // A question name is one directory entry, never a path.
    static const QRegularExpression pattern("^[A-Za-z0-9_][A-Za-z0-9_.-]*$");
    return !questionName.contains("..") && pattern.match(questionName).hasMatch();
}

std::optional<QString> QuestionRepository::readText(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }
    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);
    return in.readAll();
}

Stage QuestionRepository::stageFromJson(const QJsonObject &object) {
    Stage stage;
    stage.name = object.value("name").toString(QStringLiteral("Stage"));
    stage.visibleTests = stringList(object.value("visible_tests"));
    stage.hiddenTests = stringList(object.value("hidden_tests"));
    stage.revealFiles = stringList(object.value("reveal_files"));
    return stage;
}

QStringList QuestionRepository::discoverHiddenFiles(const QString &rootPath) {
    const QDir root(rootPath);
    QStringList hidden;
    const QFileInfoList entries = root.entryInfoList(QDir::Files | QDir::NoSymLinks, QDir::Name);
    for (const QFileInfo &entry : entries) {
        const QString fileName = entry.fileName();
        if (fileName.startsWith("hiddenTests.") || fileName.startsWith("hidden_")) {
            hidden << fileName;
        }
    }
    return hidden;
}

std::optional<QuestionConfig> QuestionRepository::parseConfig(const QByteArray &json,
                                                              const QString &rootPath,
                                                              EngineError *errorOut) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("question.json is not valid JSON: %1").arg(parseError.errorString()));
        return std::nullopt;
    }

    const QJsonObject data = doc.object();
    const QString name = data.value("name").toString();
    if (name.isEmpty()) {
        setError(errorOut, EngineError::Kind::Internal, "question.json is missing \"name\"");
        return std::nullopt;
    }

    QuestionConfig config;
    config.name = name;
    config.rootPath = rootPath;
    config.candidateEditableFiles = stringList(data.value("visible_files"));
    config.entrypoint = data.value("entrypoint").toString();
    config.environment = stringMap(data.value("environment"));
    config.defaultDurationMinutes = data.value("default_duration_minutes").toInt(60);
    config.tags = stringList(data.value("tags"));
    config.estimatedDifficulty = data.value("estimated_difficulty").toString();
    config.testDialect = data.value("test_dialect").toString(QStringLiteral("unittest"));
    config.hints = stringMap(data.value("hints"));

    const QJsonArray stagesRaw = data.value("stages").toArray();
    for (const QJsonValue &stageValue : stagesRaw) {
        config.stages << stageFromJson(stageValue.toObject());
    }

    config.hiddenFiles = data.contains("hidden_files")
        ? stringList(data.value("hidden_files"))
        : discoverHiddenFiles(rootPath);

    // Single-stage questions get one synthetic stage so that every question
    // flows through the same stage machinery.
    if (config.stages.isEmpty()) {
        Stage stage;
        stage.name = QStringLiteral("Stage 1");
        if (!config.entrypoint.isEmpty()) {
            stage.visibleTests << config.entrypoint;
        }
        stage.hiddenTests = config.hiddenFiles;
        config.stages << stage;
    }

    return config;
}

std::optional<QuestionConfig> QuestionRepository::load(const QString &questionName,
                                                       EngineError *errorOut) const {
    if (!isSafeQuestionName(questionName)) {
        setError(errorOut, EngineError::Kind::NotFound,
                 QString("Question %1 not found").arg(questionName));
        return std::nullopt;
    }

    {
        QMutexLocker locker(&cacheMutex_);
        const auto it = cache_.constFind(questionName);
        if (it != cache_.constEnd()) {
            return it.value();
        }
    }

    const QString rootPath = QDir(questionsRoot_).filePath(questionName);
    QFile file(QDir(rootPath).filePath(kConfigFile));
    if (!file.exists()) {
        setError(errorOut, EngineError::Kind::NotFound,
                 QString("Question %1 not found").arg(questionName));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to read %1: %2").arg(file.fileName(), file.errorString()));
        return std::nullopt;
    }

    std::optional<QuestionConfig> config = parseConfig(file.readAll(), rootPath, errorOut);
    if (!config) {
        qCWarning(lcQuestion) << "Rejected question" << questionName
                              << (errorOut ? errorOut->message : QString());
        return std::nullopt;
    }

    qCDebug(lcQuestion) << "Loaded question" << config->name << "with"
                        << config->stageCount() << "stage(s)";

    QMutexLocker locker(&cacheMutex_);
    cache_.insert(questionName, *config);
    return config;
}

QStringList QuestionRepository::questionNames() const {
    const QDir root(questionsRoot_);
    if (!root.exists()) {
        return {};
    }
    QStringList names;
    const QStringList dirs = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &dir : dirs) {
        if (QFileInfo::exists(QDir(root.filePath(dir)).filePath(kConfigFile))) {
            names << dir;
        }
    }
    return names;
}

QMap<QString, QString> QuestionRepository::visibleFiles(const QuestionConfig &config) const {
    const QDir root(config.rootPath);
    QMap<QString, QString> files;
    if (const auto desc = readText(root.filePath(kDescriptionFile))) {
        files.insert(kDescriptionFile, *desc);
    }
    for (const QString &relativePath : config.candidateEditableFiles) {
        const auto path = PathGuard::resolveInside(config.rootPath, relativePath);
        if (!path) {
            qCWarning(lcQuestion) << "Skipping editable file outside question root:" << relativePath;
            continue;
        }
        if (const auto content = readText(*path)) {
            files.insert(relativePath, *content);
        }
    }
    return files;
}

QMap<QString, QString> QuestionRepository::revealedFiles(const QuestionConfig &config,
                                                         int stageIndex) const {
    QMap<QString, QString> files;
    if (stageIndex < 0 || stageIndex >= config.stageCount()) {
        return files;
    }
    const Stage &stage = config.stages.at(stageIndex);
    for (const QString &relativePath : stage.revealFiles + stage.visibleTests) {
        // Hidden targets are never revealed, even if a stage lists one by mistake.
        if (stage.hiddenTests.contains(relativePath) || config.hiddenFiles.contains(relativePath)) {
            continue;
        }
        const auto path = PathGuard::resolveInside(config.rootPath, relativePath);
        if (!path) {
            qCWarning(lcQuestion) << "Skipping reveal file outside question root:" << relativePath;
            continue;
        }
        if (const auto content = readText(*path)) {
            files.insert(relativePath, *content);
        }
    }
    return files;
}

void QuestionRepository::clearCache() {
    QMutexLocker locker(&cacheMutex_);
    cache_.clear();
}
