#pragma once

#include "core/EngineError.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QVariantMap>

#include <optional>

// Running record of one collaboration session: mode switches, struggle
// moments, concept lookups, the test timeline and the final code.
class SessionJournal {
public:
    explicit SessionJournal(const QString &questionName);

    void logModeSwitch(const QString &previous, const QString &current,
                       const QString &trigger, double timestamp);
    void logStruggle(const QString &kind, double timestamp, const QVariantMap &context);
    void logLookup(const QString &query, const QString &summary);
    void logTestResult(int stageIndex, int visiblePassed, int visibleTotal);
    void setFinalCode(const QString &code) { finalCode_ = code; }

    int modeSwitchCount() const { return static_cast<int>(modeSwitches_.size()); }
    int struggleCount() const { return static_cast<int>(struggleMoments_.size()); }
    int lookupCount() const { return static_cast<int>(lookups_.size()); }
    int testResultCount() const { return static_cast<int>(testTimeline_.size()); }

    QJsonObject toJson() const;

    // Writes indented JSON, creating parent directories.
    bool save(const QString &path, EngineError *errorOut = nullptr) const;

private:
    QString questionName_;
    QJsonArray modeSwitches_;
    QJsonArray struggleMoments_;
    QJsonArray lookups_;
    QJsonArray testTimeline_;
    std::optional<QString> finalCode_;
};
