#pragma once

#include "collab/StruggleDetector.h"
#include "execution/SandboxConfig.h"
#include "session/SessionLedger.h"

#include <QString>

class QSettings;

// Everything the pairbench process reads from its settings store.
struct ServiceSettings {
    quint16 port = 10043;
    QString questionsRoot = QStringLiteral("questions");
    QString scratchRoot;   // empty means the system temp directory
    QString journalDir;    // empty disables journal saving
    QString loggingRules;

    SandboxConfig sandbox;
    SessionLimits sessionLimits;
    StruggleThresholds coach;

    static ServiceSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};
