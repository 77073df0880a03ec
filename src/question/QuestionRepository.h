#pragma once

#include "core/EngineError.h"
#include "question/QuestionConfig.h"

#include <QHash>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>

#include <optional>

class QJsonObject;

// Loads question definitions from a directory laid out as:
//   <questionsRoot>/<name>/question.json   - stages, editable files, dialect
//   <questionsRoot>/<name>/desc.md         - level 1 description
//   <questionsRoot>/<name>/...             - stock code, visible and hidden tests
//
// Configs are parsed once and cached. The cache is guarded so concurrent
// executions can share one repository.
class QuestionRepository {
public:
    static constexpr const char *kConfigFile = "question.json";
    static constexpr const char *kDescriptionFile = "desc.md";

    explicit QuestionRepository(const QString &questionsRoot);

    QString questionsRoot() const { return questionsRoot_; }

    std::optional<QuestionConfig> load(const QString &questionName,
                                       EngineError *errorOut = nullptr) const;

    QStringList questionNames() const;

    // desc.md plus every candidate-editable file that exists in the question.
    QMap<QString, QString> visibleFiles(const QuestionConfig &config) const;

    // Files handed to the candidate when stageIndex becomes reachable:
    // the stage's reveal files followed by its visible tests.
    QMap<QString, QString> revealedFiles(const QuestionConfig &config, int stageIndex) const;

    // Drops cached configs so edited question.json files are picked up.
    void clearCache();

    static std::optional<QuestionConfig> parseConfig(const QByteArray &json,
                                                     const QString &rootPath,
                                                     EngineError *errorOut = nullptr);

private:
    static Stage stageFromJson(const QJsonObject &object);
    static QStringList discoverHiddenFiles(const QString &rootPath);
    static bool isSafeQuestionName(const QString &questionName);
    static std::optional<QString> readText(const QString &path);

    QString questionsRoot_;
    mutable QMutex cacheMutex_;
    mutable QHash<QString, QuestionConfig> cache_;
};
