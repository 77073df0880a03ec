#include "collab/ModeStateMachine.h"

QString modeName(Mode mode) {
    return mode == Mode::HumanDrives ? QStringLiteral("human_drives") : QStringLiteral("bot_drives");
}

std::optional<Mode> modeFromName(const QString &name) {
    const QString normalized = name.trimmed().toLower();
    if (normalized == "bot_drives") {
        return Mode::BotDrives;
    }
    if (normalized == "human_drives") {
        return Mode::HumanDrives;
    }
    return std::nullopt;
}

namespace ModeCommands {

const QStringList &botPhrases() {
    static const QStringList phrases = {
        QStringLiteral("take over"),
        QStringLiteral("you drive"),
        QStringLiteral("bot drives"),
        QStringLiteral("your turn")
    };
    return phrases;
}

const QStringList &humanPhrases() {
    static const QStringList phrases = {
        QStringLiteral("let me try"),
        QStringLiteral("i'll drive"),
        QStringLiteral("my turn"),
        QStringLiteral("i will drive")
    };
    return phrases;
}

QString normalizeUtterance(const QString &text) {
    QString normalized = text.toLower().trimmed();
    normalized.replace('-', ' ');
    return normalized.simplified();
}

std::optional<Mode> detectModeCommand(const QString &utterance) {
    const QString normalized = normalizeUtterance(utterance);
    for (const QString &phrase : botPhrases()) {
        if (normalized.contains(phrase)) {
            return Mode::BotDrives;
        }
    }
    for (const QString &phrase : humanPhrases()) {
        if (normalized.contains(phrase)) {
            return Mode::HumanDrives;
        }
    }
    return std::nullopt;
}

} // namespace ModeCommands

std::optional<ModeTransition> ModeStateMachine::setMode(Mode target, const QString &trigger) {
    if (target == mode_) {
        return std::nullopt;
    }
    ModeTransition transition{mode_, target, trigger};
    mode_ = target;
    return transition;
}

std::optional<ModeTransition> ModeStateMachine::applyVoiceCommand(const QString &utterance) {
    const std::optional<Mode> target = ModeCommands::detectModeCommand(utterance);
    if (!target) {
        return std::nullopt;
    }
    return setMode(*target, utterance);
}
