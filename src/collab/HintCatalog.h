#pragma once

#include "collab/StruggleDetector.h"

#include <QMap>
#include <QString>

// Coaching text for a struggle signal at a 1-based level.
//
// A question can override the built-in text through the "hints" object of
// its question.json. Keys are a signal kind ("repeated_failure") or a kind
// pinned to one level ("repeated_failure:3"); the level-specific key wins.
class HintCatalog {
public:
    explicit HintCatalog(const QMap<QString, QString> &overrides = {});

    QString hintFor(const StruggleSignal &signal, int level) const;

    static QString defaultHint(SignalKind kind, int level);

private:
    QMap<QString, QString> overrides_;
};
