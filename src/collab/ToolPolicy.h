#pragma once

#include "collab/ModeStateMachine.h"
#include "core/EngineError.h"

#include <QList>
#include <QString>

#include <optional>

enum class ToolAction {
    ReadFile,
    ReadDescription,
    LookupConcept,
    ApplyPatch,
    ExecuteTests,
    GetCurrentCode,
    GetRunHistory
};

QString toolActionName(ToolAction action);
std::optional<ToolAction> toolActionFromName(const QString &name);

// Capabilities per driving mode. Reading is always allowed; editing and
// running belong to the bot, inspecting the candidate's work belongs to
// the human-drives observer.
namespace ToolPolicy {

QList<ToolAction> allowedActions(Mode mode);
bool isAllowed(Mode mode, ToolAction action);

// Fails with PolicyViolation and logs the attempt.
bool assertAllowed(Mode mode, ToolAction action, EngineError *errorOut = nullptr);

} // namespace ToolPolicy
