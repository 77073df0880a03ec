#include "core/Logging.h"

Q_LOGGING_CATEGORY(lcQuestion, "pairbench.question")
Q_LOGGING_CATEGORY(lcWorkspace, "pairbench.workspace")
Q_LOGGING_CATEGORY(lcExecution, "pairbench.execution")
Q_LOGGING_CATEGORY(lcSession, "pairbench.session")
Q_LOGGING_CATEGORY(lcCollab, "pairbench.collab")
Q_LOGGING_CATEGORY(lcServer, "pairbench.server")
