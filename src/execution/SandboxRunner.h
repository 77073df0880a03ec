#pragma once

#include "execution/SandboxConfig.h"
#include "execution/SummaryParser.h"
#include "execution/TestTargetRunner.h"

#include <QMap>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <memory>

class QProcess;

// Executes one test target in an isolated, resource-limited process and
// classifies its output through an OutputSummaryParser.
//
// Docker runtime: a --rm container with no network, a CPU share, a memory
// ceiling, a pids limit, the workspace mounted read-only and a size-bounded
// tmpfs at /tmp.
// Local runtime: the interpreter runs in its own session with rlimits on
// address space, CPU, file size and process count, inside fresh network and
// mount namespaces where the workspace is bound read-only; TMPDIR points at
// a per-run scratch directory. A host that cannot provide the namespaces
// fails the run with EnvironmentUnavailable.
//
// On timeout the whole process group (or container) is killed with no
// grace period and the call fails with Timeout; no partial result is
// returned. A target that exits normally still has its process group
// killed, so nothing it started in the background survives the run.
class SandboxRunner : public TestTargetRunner {
public:
    // Exit status a local child uses when it cannot enter its namespaces.
    static constexpr int kIsolationFailureExit = 125;
    // Exit status of `docker run` when the daemon itself fails.
    static constexpr int kDockerDaemonFailureExit = 125;
    static constexpr int kStartTimeoutMs = 5000;
    static constexpr int kPollIntervalMs = 25;

    explicit SandboxRunner(const SandboxConfig &config,
                           std::shared_ptr<const OutputSummaryParser> parser = nullptr,
                           const QMap<QString, QString> &extraEnvironment = {});

    std::optional<RunResult> run(const QString &sandboxRoot,
                                 const QString &testTarget,
                                 EngineError *errorOut = nullptr) const override;

    const SandboxConfig &config() const { return config_; }

    QStringList dockerArguments(const QString &sandboxRoot,
                                const QString &testTarget,
                                const QString &containerName,
                                const QString &cidFile = QString()) const;

    // The configured docker binary, or "docker" when the setting is blank.
    QString dockerProgram() const;

private:
    struct LaunchPlan {
        QString program;
        QStringList args;
        QString containerName;
        QString cidFile;  // written by docker only once the container exists
    };

    std::optional<LaunchPlan> planLaunch(const QString &sandboxRoot,
                                         const QString &targetPath,
                                         const QString &testTarget,
                                         const QString &scratchDir,
                                         EngineError *errorOut) const;
    QProcessEnvironment localEnvironment(const QString &scratchDir) const;
    void configureLocalChild(QProcess &process, const QString &sandboxRoot, int failureFd) const;
    void killProcessTree(QProcess &process, const LaunchPlan &plan, qint64 childPid) const;

    SandboxConfig config_;
    std::shared_ptr<const OutputSummaryParser> parser_;
    QMap<QString, QString> extraEnvironment_;
};
