#include "collab/StruggleDetector.h"
#include "core/Logging.h"

#include <QCryptographicHash>
#include <QStringList>

namespace {

// Length in code points, so a non-BMP character counts once.
int codePointLength(const QString &text) {
    return static_cast<int>(text.toUcs4().size());
}

} // namespace

QString signalKindName(SignalKind kind) {
    switch (kind) {
    case SignalKind::LongPause:       return QStringLiteral("long_pause");
    case SignalKind::RepeatedFailure: return QStringLiteral("repeated_failure");
    case SignalKind::Backtrack:       return QStringLiteral("backtrack");
    case SignalKind::LevelWall:       return QStringLiteral("level_wall");
    case SignalKind::ExplicitAsk:     return QStringLiteral("explicit_ask");
    }
    return QString();
}

StruggleDetector::StruggleDetector(const StruggleThresholds &thresholds)
    : thresholds_(thresholds) {}

std::optional<StruggleSignal> StruggleDetector::emitSignal(SignalKind kind, double now,
                                                           const QVariantMap &context) {
    if (now - lastSignalTime_ < thresholds_.cooldownSeconds) {
        qCDebug(lcCollab) << "Suppressed" << signalKindName(kind) << "during cooldown";
        return std::nullopt;
    }
    lastSignalTime_ = now;
    StruggleSignal signal;
    signal.kind = kind;
    signal.timestamp = now;
    signal.context = context;
    qCInfo(lcCollab) << "Struggle signal" << signalKindName(kind) << context;
    return signal;
}

std::optional<StruggleSignal> StruggleDetector::onCodeUpdate(const QString &code, double now) {
    const int length = codePointLength(code);
    std::optional<StruggleSignal> signal;
    if (!codeLengths_.isEmpty()) {
        const int previous = codeLengths_.last();
        const int threshold = static_cast<int>(previous * (1.0 - thresholds_.backtrackRatio));
        if (length < threshold) {
            signal = emitSignal(SignalKind::Backtrack, now,
                                {{"previous_size", previous}, {"current_size", length}});
        }
    }
    codeLengths_ << length;
    lastEditTime_ = now;
    return signal;
}

std::optional<StruggleSignal> StruggleDetector::onRunResult(int exitCode, const QString &output,
                                                            int stageIndex, double now) {
    const QByteArray digest = QCryptographicHash::hash(output.toUtf8(), QCryptographicHash::Md5);
    runs_ << RunRecord{exitCode, digest, stageIndex};
    if (runs_.size() < 2) {
        return std::nullopt;
    }
    const RunRecord &last = runs_.at(runs_.size() - 1);
    const RunRecord &previous = runs_.at(runs_.size() - 2);
    if (last.exitCode == previous.exitCode && last.digest == previous.digest && last.exitCode != 0) {
        return emitSignal(SignalKind::RepeatedFailure, now,
                          {{"stage_index", stageIndex}, {"exit_code", exitCode}});
    }
    return std::nullopt;
}

void StruggleDetector::onLevelStart(int level, double now) {
    levelStartTimes_.insert(level, now);
}

std::optional<StruggleSignal> StruggleDetector::onUserMessage(const QString &message, double now) {
    static const QStringList helpMarkers = {
        QStringLiteral("help"),
        QStringLiteral("stuck"),
        QStringLiteral("hint"),
        QStringLiteral("what should i do"),
        QStringLiteral("not sure")
    };
    const QString normalized = message.toLower();
    for (const QString &marker : helpMarkers) {
        if (normalized.contains(marker)) {
            return emitSignal(SignalKind::ExplicitAsk, now, {{"message", message}});
        }
    }
    return std::nullopt;
}

std::optional<StruggleSignal> StruggleDetector::checkIdle(bool testsStillFailing, double now) {
    if (!testsStillFailing || !lastEditTime_) {
        return std::nullopt;
    }
    const double idle = now - *lastEditTime_;
    if (idle >= thresholds_.idleSeconds) {
        return emitSignal(SignalKind::LongPause, now, {{"seconds", static_cast<int>(idle)}});
    }
    return std::nullopt;
}

std::optional<StruggleSignal> StruggleDetector::checkLevelWall(int level, double now) {
    const auto it = levelStartTimes_.constFind(level);
    if (it == levelStartTimes_.constEnd()) {
        return std::nullopt;
    }
    const double elapsed = now - it.value();
    if (elapsed >= thresholds_.levelWallSeconds) {
        return emitSignal(SignalKind::LevelWall, now,
                          {{"level", level}, {"seconds", static_cast<int>(elapsed)}});
    }
    return std::nullopt;
}
