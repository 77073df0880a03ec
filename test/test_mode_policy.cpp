#include "collab/ModeStateMachine.h"
#include "collab/ToolPolicy.h"
#include "TestSupport.h"

#include <QCoreApplication>

#include <cstdlib>

using TestSupport::check;

namespace {

bool testSetModeIsIdempotent() {
    ModeStateMachine machine;
    bool ok = true;
    ok = check(machine.mode() == Mode::BotDrives, "The bot drives first") && ok;
    ok = check(!machine.setMode(Mode::BotDrives), "Setting the current mode is a no-op") && ok;

    const auto transition = machine.setMode(Mode::HumanDrives, "ui_toggle");
    ok = check(transition && transition->previous == Mode::BotDrives && transition->current == Mode::HumanDrives &&
                   transition->trigger == "ui_toggle",
               "A real change reports previous, current and trigger") && ok;
    ok = check(machine.mode() == Mode::HumanDrives, "The mode changes") && ok;
    return ok;
}

bool testVoiceCommands() {
    ModeStateMachine machine;
    QList<ModeTransition> transitions;
    const QStringList utterances = {
        "Let me try this one",
        "let me try again",
        "OK, Take-Over please",
        "what does this function do?"
    };
    for (const QString &utterance : utterances) {
        if (const auto transition = machine.applyVoiceCommand(utterance)) {
            transitions << *transition;
        }
    }
    bool ok = true;
    ok = check(transitions.size() == 2, QString("Expected 2 transitions, got %1").arg(transitions.size())) && ok;
    if (transitions.size() == 2) {
        ok = check(transitions.at(0).current == Mode::HumanDrives && transitions.at(0).trigger == "Let me try this one",
                   "The first transition hands control to the human with the raw utterance") && ok;
        ok = check(transitions.at(1).previous == Mode::HumanDrives && transitions.at(1).current == Mode::BotDrives,
                   "The second transition hands control back to the bot") && ok;
    }
    return ok;
}

bool testPhraseNormalization() {
    bool ok = true;
    ok = check(ModeCommands::normalizeUtterance("  You-Drive\t NOW ") == "you drive now", "Normalization") && ok;
    ok = check(ModeCommands::detectModeCommand("I'll DRIVE") == Mode::HumanDrives, "Case is ignored") && ok;
    ok = check(ModeCommands::detectModeCommand("bot-drives") == Mode::BotDrives, "Hyphens become spaces") && ok;
    ok = check(!ModeCommands::detectModeCommand("drive me home"), "Unrelated speech is not a command") && ok;

    for (const QString &bot : ModeCommands::botPhrases()) {
        for (const QString &human : ModeCommands::humanPhrases()) {
            ok = check(!bot.contains(human) && !human.contains(bot),
                       QString("Phrases overlap: '%1' and '%2'").arg(bot, human)) && ok;
        }
    }
    return ok;
}

bool testPolicyMatrix() {
    bool ok = true;
    for (ToolAction action : {ToolAction::ReadFile, ToolAction::ReadDescription, ToolAction::LookupConcept}) {
        ok = check(ToolPolicy::isAllowed(Mode::BotDrives, action) && ToolPolicy::isAllowed(Mode::HumanDrives, action),
                   toolActionName(action) + " should be allowed in both modes") && ok;
    }
    for (ToolAction action : {ToolAction::ApplyPatch, ToolAction::ExecuteTests}) {
        ok = check(ToolPolicy::isAllowed(Mode::BotDrives, action) && !ToolPolicy::isAllowed(Mode::HumanDrives, action),
                   toolActionName(action) + " belongs to the bot") && ok;
    }
    for (ToolAction action : {ToolAction::GetCurrentCode, ToolAction::GetRunHistory}) {
        ok = check(!ToolPolicy::isAllowed(Mode::BotDrives, action) && ToolPolicy::isAllowed(Mode::HumanDrives, action),
                   toolActionName(action) + " belongs to the observer") && ok;
    }

    EngineError error;
    ok = check(!ToolPolicy::assertAllowed(Mode::HumanDrives, ToolAction::ApplyPatch, &error), "Denied action") && ok;
    ok = check(error.kind == EngineError::Kind::PolicyViolation &&
                   error.message == "Action 'apply_patch' is disabled while in mode 'human_drives'.",
               "Unexpected policy message: " + error.message) && ok;
    ok = check(toolActionFromName("get_run_history") == ToolAction::GetRunHistory, "Names round trip") && ok;
    ok = check(!toolActionFromName("rm_rf"), "Unknown action names are rejected") && ok;
    ok = check(modeFromName("HUMAN_DRIVES") == Mode::HumanDrives && !modeFromName("autopilot"), "Mode names") && ok;
    return ok;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    bool ok = true;
    ok = testSetModeIsIdempotent() && ok;
    ok = testVoiceCommands() && ok;
    ok = testPhraseNormalization() && ok;
    ok = testPolicyMatrix() && ok;

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
