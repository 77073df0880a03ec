#pragma once

#include <QString>
#include <QStringList>

#include <optional>

enum class Mode {
    BotDrives,
    HumanDrives
};

QString modeName(Mode mode);
std::optional<Mode> modeFromName(const QString &name);

struct ModeTransition {
    Mode previous;
    Mode current;
    QString trigger;
};

namespace ModeCommands {

// No phrase of one set is a substring of a phrase in the other.
const QStringList &botPhrases();
const QStringList &humanPhrases();

// Lower-cases, turns hyphens into spaces and collapses whitespace.
QString normalizeUtterance(const QString &text);

// Bot phrases are tested first; the first contained phrase decides.
std::optional<Mode> detectModeCommand(const QString &utterance);

} // namespace ModeCommands

// Who is driving the keyboard. Starts with the bot and changes only on an
// explicit request.
class ModeStateMachine {
public:
    explicit ModeStateMachine(Mode initial = Mode::BotDrives) : mode_(initial) {}

    Mode mode() const { return mode_; }

    // No transition when target is already the current mode.
    std::optional<ModeTransition> setMode(Mode target, const QString &trigger = QStringLiteral("manual"));

    // The raw utterance is recorded as the trigger.
    std::optional<ModeTransition> applyVoiceCommand(const QString &utterance);

private:
    Mode mode_;
};
