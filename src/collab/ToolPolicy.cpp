#include "collab/ToolPolicy.h"
#include "core/Logging.h"

namespace {

const QList<ToolAction> kSharedActions = {
    ToolAction::ReadFile,
    ToolAction::ReadDescription,
    ToolAction::LookupConcept
};

const QList<ToolAction> kBotOnlyActions = {
    ToolAction::ApplyPatch,
    ToolAction::ExecuteTests
};

const QList<ToolAction> kHumanOnlyActions = {
    ToolAction::GetCurrentCode,
    ToolAction::GetRunHistory
};

const QList<ToolAction> kAllActions = kSharedActions + kBotOnlyActions + kHumanOnlyActions;

} // namespace

QString toolActionName(ToolAction action) {
    switch (action) {
    case ToolAction::ReadFile:        return QStringLiteral("read_file");
    case ToolAction::ReadDescription: return QStringLiteral("read_description");
    case ToolAction::LookupConcept:   return QStringLiteral("lookup_concept");
    case ToolAction::ApplyPatch:      return QStringLiteral("apply_patch");
    case ToolAction::ExecuteTests:    return QStringLiteral("execute_tests");
    case ToolAction::GetCurrentCode:  return QStringLiteral("get_current_code");
    case ToolAction::GetRunHistory:   return QStringLiteral("get_run_history");
    }
    return QString();
}

std::optional<ToolAction> toolActionFromName(const QString &name) {
    for (ToolAction action : kAllActions) {
        if (toolActionName(action) == name) {
            return action;
        }
    }
    return std::nullopt;
}

namespace ToolPolicy {

QList<ToolAction> allowedActions(Mode mode) {
    return kSharedActions + (mode == Mode::BotDrives ? kBotOnlyActions : kHumanOnlyActions);
}

bool isAllowed(Mode mode, ToolAction action) {
    return allowedActions(mode).contains(action);
}

bool assertAllowed(Mode mode, ToolAction action, EngineError *errorOut) {
    if (isAllowed(mode, action)) {
        return true;
    }
    const QString message = QString("Action '%1' is disabled while in mode '%2'.")
                                .arg(toolActionName(action), modeName(mode));
    qCWarning(lcCollab) << "Policy violation:" << message;
    setError(errorOut, EngineError::Kind::PolicyViolation, message);
    return false;
}

} // namespace ToolPolicy
