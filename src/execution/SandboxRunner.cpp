#include "execution/SandboxRunner.h"
#include "execution/ExecutionUtils.h"
#include "workspace/PathGuard.h"
#include "workspace/WorkspaceMaterializer.h"
#include "core/Logging.h"

#include <QDeadlineTimer>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>
#include <QUuid>

#include <algorithm>
#include <csignal>
#ifdef Q_OS_UNIX
#include <fcntl.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/statvfs.h>
#include <unistd.h>
#endif

namespace {

#ifdef Q_OS_UNIX
// Codes a local child writes to the launch-failure pipe before exec.
constexpr char kNamespaceFailure = 'n';
constexpr char kMountFailure = 'm';

[[noreturn]] void failLocalChild(int fd, char code) {
    [[maybe_unused]] const ssize_t written = ::write(fd, &code, 1);
    ::_exit(SandboxRunner::kIsolationFailureExit);
}

// Close-on-exec pipe that only a child failing before exec writes to, so
// nothing the target prints can pose as an isolation failure.
class LaunchFailurePipe {
public:
    LaunchFailurePipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            fds_[0] = fds_[1] = -1;
            return;
        }
        ::fcntl(fds_[0], F_SETFL, O_NONBLOCK);
    }

    ~LaunchFailurePipe() {
        closeWriteEnd();
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
        }
    }

    LaunchFailurePipe(const LaunchFailurePipe &) = delete;
    LaunchFailurePipe &operator=(const LaunchFailurePipe &) = delete;

    bool isValid() const { return fds_[0] >= 0; }
    int writeFd() const { return fds_[1]; }

    void closeWriteEnd() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

    // 0 when the child reached exec.
    char failureCode() const {
        char code = 0;
        if (fds_[0] >= 0 && ::read(fds_[0], &code, 1) == 1) {
            return code;
        }
        return 0;
    }

private:
    int fds_[2] = {-1, -1};
};

// A bind remount inside a user namespace must keep the flags the host
// mount already has, or the kernel refuses it.
unsigned long readOnlyRemountFlags(const QByteArray &path) {
    unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY;
    struct statvfs fs;
    if (::statvfs(path.constData(), &fs) == 0) {
        if (fs.f_flag & ST_NOSUID) {
            flags |= MS_NOSUID;
        }
        if (fs.f_flag & ST_NODEV) {
            flags |= MS_NODEV;
        }
        if (fs.f_flag & ST_NOEXEC) {
            flags |= MS_NOEXEC;
        }
        if (fs.f_flag & ST_NOATIME) {
            flags |= MS_NOATIME;
        }
        if (fs.f_flag & ST_NODIRATIME) {
            flags |= MS_NODIRATIME;
        }
    }
    return flags;
}
#endif

} // namespace

SandboxRunner::SandboxRunner(const SandboxConfig &config,
                             std::shared_ptr<const OutputSummaryParser> parser,
                             const QMap<QString, QString> &extraEnvironment)
    : config_(config),
      parser_(parser ? std::move(parser) : std::make_shared<UnittestSummaryParser>()),
      extraEnvironment_(extraEnvironment) {}

QString SandboxRunner::dockerProgram() const {
    const QString configured = config_.dockerPath.trimmed();
    return configured.isEmpty() ? QStringLiteral("docker") : configured;
}

QStringList SandboxRunner::dockerArguments(const QString &sandboxRoot,
                                           const QString &testTarget,
                                           const QString &containerName,
                                           const QString &cidFile) const {
    QStringList args;
    args << "run" << "--rm"
         << "--name" << containerName;
    if (!cidFile.isEmpty()) {
        args << "--cidfile" << cidFile;
    }
    args << "--network" << "none"
         << "--cpus" << config_.cpuLimit
         << "--memory" << config_.memoryLimit
         << "--pids-limit" << QString::number(config_.pidsLimit)
         << "--tmpfs" << QString("/tmp:rw,size=%1").arg(config_.tmpfsSize);
    for (const QString &entry : config_.environment) {
        args << "-e" << entry;
    }
    for (auto it = extraEnvironment_.constBegin(); it != extraEnvironment_.constEnd(); ++it) {
        args << "-e" << QString("%1=%2").arg(it.key(), it.value());
    }
    args << "-v" << QString("%1:/workspace:ro").arg(QDir(sandboxRoot).absolutePath())
         << "-w" << "/workspace"
         << config_.image;
    args << ExecutionUtils::splitArgs(config_.interpreter);
    args << testTarget;
    return args;
}

std::optional<SandboxRunner::LaunchPlan> SandboxRunner::planLaunch(const QString &sandboxRoot,
                                                                   const QString &targetPath,
                                                                   const QString &testTarget,
                                                                   const QString &scratchDir,
                                                                   EngineError *errorOut) const {
    LaunchPlan plan;
    if (config_.runtime == SandboxConfig::Runtime::Docker) {
        plan.program = dockerProgram();
        plan.containerName = QString("pairbench-%1").arg(QUuid::createUuid().toString(QUuid::Id128));
        plan.cidFile = QDir(scratchDir).filePath("container.id");
        plan.args = dockerArguments(sandboxRoot, PathGuard::normalizeRelative(testTarget),
                                    plan.containerName, plan.cidFile);
        return plan;
    }

    const QStringList interpreter = ExecutionUtils::splitArgs(config_.localInterpreter);
    if (interpreter.isEmpty()) {
        setError(errorOut, EngineError::Kind::EnvironmentUnavailable,
                 "Local interpreter is not configured");
        return std::nullopt;
    }
    plan.program = interpreter.first();
    plan.args = interpreter.mid(1);
    plan.args << targetPath;
    return plan;
}

QProcessEnvironment SandboxRunner::localEnvironment(const QString &scratchDir) const {
    const QProcessEnvironment system = QProcessEnvironment::systemEnvironment();
    QProcessEnvironment env;
    env.insert("PATH", system.value("PATH", "/usr/local/bin:/usr/bin:/bin"));
    env.insert("LANG", system.value("LANG", "C.UTF-8"));
    env.insert("HOME", scratchDir);
    env.insert("TMPDIR", scratchDir);
    for (const QString &entry : config_.environment) {
        const qsizetype eq = entry.indexOf('=');
        if (eq > 0) {
            env.insert(entry.left(eq), entry.mid(eq + 1));
        }
    }
    for (auto it = extraEnvironment_.constBegin(); it != extraEnvironment_.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }
    return env;
}

void SandboxRunner::configureLocalChild(QProcess &process, const QString &sandboxRoot, int failureFd) const {
#ifdef Q_OS_UNIX
    const rlim_t memoryBytes = static_cast<rlim_t>(config_.localMemoryBytes);
    const rlim_t cpuSeconds = static_cast<rlim_t>(config_.localCpuSeconds);
    const rlim_t scratchBytes = static_cast<rlim_t>(config_.localScratchBytes);
    const rlim_t processLimit = static_cast<rlim_t>(config_.localProcessLimit);
    const bool isolateNetwork = config_.isolateNetwork;
    const bool isolateFilesystem = config_.isolateFilesystem;
    const QByteArray root = QFile::encodeName(QFileInfo(sandboxRoot).canonicalFilePath());
    const unsigned long remountFlags = readOnlyRemountFlags(root);

    // Runs in the forked child before exec: only async-signal-safe calls.
    process.setChildProcessModifier([=]() {
        ::setsid();

        struct rlimit limit;
        if (memoryBytes > 0) {
            limit.rlim_cur = limit.rlim_max = memoryBytes;
            ::setrlimit(RLIMIT_AS, &limit);
        }
        if (cpuSeconds > 0) {
            limit.rlim_cur = cpuSeconds;
            limit.rlim_max = cpuSeconds + 1;
            ::setrlimit(RLIMIT_CPU, &limit);
        }
        if (scratchBytes > 0) {
            limit.rlim_cur = limit.rlim_max = scratchBytes;
            ::setrlimit(RLIMIT_FSIZE, &limit);
        }
        if (processLimit > 0) {
            limit.rlim_cur = limit.rlim_max = processLimit;
            ::setrlimit(RLIMIT_NPROC, &limit);
        }

        int namespaces = 0;
        if (isolateNetwork) {
            namespaces |= CLONE_NEWNET;
        }
        if (isolateFilesystem) {
            namespaces |= CLONE_NEWNS;
        }
        if (namespaces != 0 && ::unshare(CLONE_NEWUSER | namespaces) != 0) {
            failLocalChild(failureFd, kNamespaceFailure);
        }

        // The workspace is bound over itself read-only in the private mount
        // namespace; the chdir moves off the writable mount underneath.
        if (isolateFilesystem &&
            (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0 ||
             ::mount(root.constData(), root.constData(), nullptr, MS_BIND | MS_REC, nullptr) != 0 ||
             ::mount(nullptr, root.constData(), nullptr, remountFlags, nullptr) != 0 ||
             ::chdir(root.constData()) != 0)) {
            failLocalChild(failureFd, kMountFailure);
        }
    });
#else
    Q_UNUSED(process);
    Q_UNUSED(sandboxRoot);
    Q_UNUSED(failureFd);
#endif
}

void SandboxRunner::killProcessTree(QProcess &process, const LaunchPlan &plan, qint64 childPid) const {
#ifdef Q_OS_UNIX
    if (childPid > 0) {
        ::kill(-static_cast<pid_t>(childPid), SIGKILL);
    }
#else
    Q_UNUSED(childPid);
#endif
    process.kill();
    process.waitForFinished(1000);

    // Killing the docker client does not stop the container.
    if (!plan.containerName.isEmpty()) {
        QProcess reaper;
        reaper.start(plan.program, {"rm", "-f", plan.containerName});
        if (!reaper.waitForFinished(kStartTimeoutMs)) {
            reaper.kill();
            reaper.waitForFinished(1000);
            qCWarning(lcExecution) << "Timed out removing container" << plan.containerName;
        }
    }
}

std::optional<RunResult> SandboxRunner::run(const QString &sandboxRoot,
                                            const QString &testTarget,
                                            EngineError *errorOut) const {
    const auto targetPath = PathGuard::resolveInside(sandboxRoot, testTarget, errorOut);
    if (!targetPath) {
        return std::nullopt;
    }

    const QTemporaryDir scratch;
    if (!scratch.isValid()) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to create scratch directory: %1").arg(scratch.errorString()));
        return std::nullopt;
    }

    const std::optional<LaunchPlan> plan = planLaunch(sandboxRoot, *targetPath, testTarget,
                                                      scratch.path(), errorOut);
    if (!plan) {
        return std::nullopt;
    }
    const bool local = config_.runtime == SandboxConfig::Runtime::Local;

    QProcess process;
#ifdef Q_OS_UNIX
    LaunchFailurePipe failurePipe;
    if (local && !failurePipe.isValid()) {
        setError(errorOut, EngineError::Kind::Internal, "Failed to create the launch pipe");
        return std::nullopt;
    }
#endif
    if (local) {
        if (!WorkspaceMaterializer::makeReadOnly(sandboxRoot)) {
            qCWarning(lcExecution) << "Could not make every file read-only under" << sandboxRoot;
        }
        process.setWorkingDirectory(sandboxRoot);
        process.setProcessEnvironment(localEnvironment(scratch.path()));
#ifdef Q_OS_UNIX
        configureLocalChild(process, sandboxRoot, failurePipe.writeFd());
#else
        configureLocalChild(process, sandboxRoot, -1);
#endif
    } else {
#ifdef Q_OS_UNIX
        // Own process group so a timeout can kill the client and anything it forked.
        process.setChildProcessModifier([]() { ::setsid(); });
#endif
    }

    QElapsedTimer timer;
    timer.start();
    process.start(plan->program, plan->args);
#ifdef Q_OS_UNIX
    failurePipe.closeWriteEnd();
#endif
    process.closeWriteChannel();

    const auto isolationFailed = [&]() {
#ifdef Q_OS_UNIX
        const char code = local ? failurePipe.failureCode() : 0;
        if (code != 0) {
            const QString message = code == kMountFailure
                ? QStringLiteral("Read-only workspace mount is unavailable on this host")
                : QStringLiteral("Sandbox namespaces are unavailable on this host");
            setError(errorOut, EngineError::Kind::EnvironmentUnavailable, message);
            qCWarning(lcExecution) << "Local isolation failed before exec:" << message;
            return true;
        }
#endif
        return false;
    };

    if (!process.waitForStarted(kStartTimeoutMs)) {
        if (isolationFailed()) {
            return std::nullopt;
        }
        if (process.error() == QProcess::FailedToStart) {
            const QString message = local
                ? QString("Sandbox interpreter %1 is not available").arg(plan->program)
                : QStringLiteral("Docker is not installed or not on PATH");
            setError(errorOut, EngineError::Kind::EnvironmentUnavailable, message);
        } else {
            setError(errorOut, EngineError::Kind::Internal,
                     QString("Execution failed: %1").arg(process.errorString()));
        }
        qCWarning(lcExecution) << "Failed to launch" << plan->program << process.errorString();
        return std::nullopt;
    }
    const qint64 childPid = process.processId();

    // Output is drained every slice so at most one slice is buffered in QProcess.
    const int timeoutMs = config_.timeoutMs > 0 ? config_.timeoutMs : SandboxConfig().timeoutMs;
    ExecutionUtils::CappedOutput out(config_.maxOutputBytes);
    ExecutionUtils::CappedOutput err(config_.maxOutputBytes);
    const auto drain = [&]() {
        out.append(process.readAllStandardOutput());
        err.append(process.readAllStandardError());
    };
    const QDeadlineTimer deadline(timeoutMs);
    while (process.state() != QProcess::NotRunning) {
        if (deadline.hasExpired()) {
            killProcessTree(process, *plan, childPid);
            setError(errorOut, EngineError::Kind::Timeout,
                     QString("Execution timed out after %1s").arg(timeoutMs / 1000.0));
            qCInfo(lcExecution) << "Timed out running" << testTarget;
            return std::nullopt;
        }
        process.waitForFinished(static_cast<int>(std::min<qint64>(deadline.remainingTime(), kPollIntervalMs)));
        drain();
    }

#ifdef Q_OS_UNIX
    // Background children of the target must not outlive the run.
    if (childPid > 0) {
        ::kill(-static_cast<pid_t>(childPid), SIGKILL);
    }
#endif
    drain();

    if (isolationFailed()) {
        return std::nullopt;
    }

    RunResult result;
    result.executionTimeMs = timer.elapsed();
    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    const QString stdOut = QString::fromUtf8(out.data());
    const QString stdErr = QString::fromUtf8(err.data());

    // 125 with no container id means the daemon never created the container;
    // a container that exits 125 itself is an ordinary failing target.
    if (!local && result.exitCode == kDockerDaemonFailureExit && !QFileInfo::exists(plan->cidFile)) {
        setError(errorOut, EngineError::Kind::EnvironmentUnavailable,
                 QString("Docker could not run the sandbox: %1").arg(stdErr.trimmed()));
        return std::nullopt;
    }

    const TestSummary summary = parser_->parse(stdOut + "\n" + stdErr);
    result.passedCount = summary.passed;
    result.totalCount = summary.total;
    result.rawOutput = ExecutionUtils::truncateOutput(stdOut + stdErr, config_.maxOutputBytes);
    if (out.overflowed() || err.overflowed()) {
        qCDebug(lcExecution) << "Output of" << testTarget << "exceeded" << config_.maxOutputBytes << "bytes";
    }

    qCDebug(lcExecution) << "Ran" << testTarget << "exit" << result.exitCode
                         << QString("%1/%2").arg(summary.passed).arg(summary.total)
                         << "in" << result.executionTimeMs << "ms";
    return result;
}
