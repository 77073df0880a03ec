#pragma once

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

// One ordered gate of a question. Hidden targets always come from the
// question's own assets, never from candidate input.
struct Stage {
    QString name;
    QStringList visibleTests;
    QStringList hiddenTests;
    QStringList revealFiles;  // shown to the candidate once this stage unlocks
};

// Declarative description of a question, loaded from <root>/<name>/question.json.
// Treated as immutable after QuestionRepository::load returns it.
struct QuestionConfig {
    QString name;
    QStringList candidateEditableFiles;
    QString entrypoint;
    QMap<QString, QString> environment;
    int defaultDurationMinutes = 60;
    QList<Stage> stages;
    QStringList tags;
    QString estimatedDifficulty;
    QString testDialect = QStringLiteral("unittest");
    QStringList hiddenFiles;
    QMap<QString, QString> hints;  // signal kind -> coaching text override
    QString rootPath;

    bool isCandidateEditable(const QString &relativePath) const {
        return candidateEditableFiles.contains(relativePath);
    }

    int stageCount() const { return static_cast<int>(stages.size()); }

    QStringList stageNames() const {
        QStringList names;
        for (const Stage &stage : stages) {
            names << stage.name;
        }
        return names;
    }
};
