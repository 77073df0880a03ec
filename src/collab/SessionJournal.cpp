#include "collab/SessionJournal.h"
#include "core/Logging.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

SessionJournal::SessionJournal(const QString &questionName)
    : questionName_(questionName) {}

void SessionJournal::logModeSwitch(const QString &previous, const QString &current,
                                   const QString &trigger, double timestamp) {
    modeSwitches_.append(QJsonObject{
        {"timestamp", timestamp},
        {"previous", previous},
        {"current", current},
        {"trigger", trigger}
    });
}

void SessionJournal::logStruggle(const QString &kind, double timestamp, const QVariantMap &context) {
    struggleMoments_.append(QJsonObject{
        {"timestamp", timestamp},
        {"kind", kind},
        {"context", QJsonObject::fromVariantMap(context)}
    });
}

void SessionJournal::logLookup(const QString &query, const QString &summary) {
    lookups_.append(QJsonObject{{"query", query}, {"summary", summary}});
}

void SessionJournal::logTestResult(int stageIndex, int visiblePassed, int visibleTotal) {
    testTimeline_.append(QJsonObject{
        {"stage_index", stageIndex},
        {"visible_passed", visiblePassed},
        {"visible_total", visibleTotal}
    });
}

QJsonObject SessionJournal::toJson() const {
    QJsonObject root;
    root["question_name"] = questionName_;
    root["mode_switches"] = modeSwitches_;
    root["struggle_moments"] = struggleMoments_;
    root["concept_lookups"] = lookups_;
    root["test_timeline"] = testTimeline_;
    root["final_code"] = finalCode_ ? QJsonValue(*finalCode_) : QJsonValue(QJsonValue::Null);
    return root;
}

bool SessionJournal::save(const QString &path, EngineError *errorOut) const {
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to create directory for %1").arg(path));
        return false;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to write journal %1: %2").arg(path, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to write journal %1: %2").arg(path, file.errorString()));
        return false;
    }
    qCInfo(lcCollab) << "Saved session journal to" << path;
    return true;
}
