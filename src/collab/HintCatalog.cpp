#include "collab/HintCatalog.h"

HintCatalog::HintCatalog(const QMap<QString, QString> &overrides)
    : overrides_(overrides) {}

QString HintCatalog::hintFor(const StruggleSignal &signal, int level) const {
    const QString kind = signalKindName(signal.kind);
    const QString pinned = overrides_.value(QString("%1:%2").arg(kind).arg(level));
    if (!pinned.isEmpty()) {
        return pinned;
    }
    const QString general = overrides_.value(kind);
    if (!general.isEmpty()) {
        return general;
    }
    return defaultHint(signal.kind, level);
}

QString HintCatalog::defaultHint(SignalKind kind, int level) {
    switch (kind) {
    case SignalKind::LongPause:
        if (level <= 2) {
            return QStringLiteral("Try working in small steps. Pick the smallest piece of the "
                                  "behavior and get that one case right first.");
        }
        return QStringLiteral("You can break this into two passes: first collect what matches, "
                              "then apply the ordering and conflict rules.");
    case SignalKind::RepeatedFailure:
        if (level >= 3) {
            return QStringLiteral("The same failure came back. Later levels usually fail on "
                                  "ordering or on state that should survive a reset; compare "
                                  "the assertion with what you return.");
        }
        return QStringLiteral("Looks like the same failure repeated. Verify missing-input "
                              "handling and how each case is dispatched.");
    case SignalKind::Backtrack:
        return QStringLiteral("No problem. Rebuild one small helper first, then connect it back.");
    case SignalKind::LevelWall:
        return QStringLiteral("You have been on this level for a while. "
                              "Want a focused hint on the exact failing assertion?");
    case SignalKind::ExplicitAsk:
        return QStringLiteral("Start with one failing test and implement only what that assertion "
                              "needs. Then rerun and iterate.");
    }
    return QStringLiteral("Keep going. If you want, I can suggest the next smallest implementation step.");
}
