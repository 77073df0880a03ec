#include "execution/ExecutionService.h"
#include "execution/SandboxRunner.h"
#include "question/QuestionRepository.h"
#include "workspace/WorkspaceMaterializer.h"
#include "TestSupport.h"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>
#include <QThread>

#include <csignal>
#include <cstdlib>

using TestSupport::check;
using TestSupport::readTextFile;
using TestSupport::writeQuestion;
using TestSupport::writeTextFile;

namespace {

// Local runtime driving /bin/sh scripts so the tests need no Python or Docker.
SandboxConfig shellConfig() {
    SandboxConfig config;
    config.runtime = SandboxConfig::Runtime::Local;
    config.localInterpreter = "/bin/sh";
    config.isolateNetwork = false;
    config.isolateFilesystem = false;
    config.localProcessLimit = 0;
    config.timeoutMs = 5000;
    config.environment.clear();
    return config;
}

// Stands in for the docker CLI. Placed under the working directory because
// the system temp directory may be mounted noexec.
QString writeFakeDocker(const QTemporaryDir &dir, const QByteArray &body) {
    const QString path = QDir(dir.path()).filePath("docker");
    writeTextFile(dir.path(), "docker",
                  "#!/bin/sh\n"
                  "if [ \"$1\" = rm ]; then echo \"$@\" >> \"$(dirname \"$0\")/rm.log\"; exit 0; fi\n"
                  "cid=\n"
                  "while [ $# -gt 0 ]; do\n"
                  "  if [ \"$1\" = --cidfile ]; then cid=$2; fi\n"
                  "  shift\n"
                  "done\n" + body);
    QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return path;
}

// A zombie waiting for its reaper counts as gone.
bool processGone(qint64 pid) {
    if (::kill(static_cast<pid_t>(pid), 0) != 0) {
        return true;
    }
    const QString stat = readTextFile(QString("/proc/%1/stat").arg(pid));
    const qsizetype close = stat.lastIndexOf(')');
    return close >= 0 && stat.mid(close + 2, 1) == "Z";
}

bool testFailingSummary() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "tests.sh",
                  "echo 'Ran 3 tests in 0.010s'\n"
                  "echo 'FAILED (failures=1)' >&2\n"
                  "exit 1\n");
    const SandboxRunner runner(shellConfig());
    EngineError error;
    const auto result = runner.run(dir.path(), "tests.sh", &error);
    if (!check(result.has_value(), "Run should succeed: " + error.message)) {
        return false;
    }
    bool ok = true;
    ok = check(result->exitCode == 1, QString("Expected exit 1, got %1").arg(result->exitCode)) && ok;
    ok = check(result->passedCount == 2 && result->totalCount == 3,
               QString("Expected 2/3, got %1/%2").arg(result->passedCount).arg(result->totalCount)) && ok;
    ok = check(result->rawOutput.indexOf("Ran 3") < result->rawOutput.indexOf("FAILED"),
               "Raw output should hold stdout followed by stderr") && ok;
    return ok;
}

bool testPassingAndSilentTargets() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "ok.sh", "echo 'Ran 2 tests in 0.001s' >&2\necho OK >&2\n");
    writeTextFile(dir.path(), "silent.sh", "exit 3\n");
    const SandboxRunner runner(shellConfig());

    bool ok = true;
    const auto passing = runner.run(dir.path(), "ok.sh");
    ok = check(passing && passing->exitCode == 0 && passing->passedCount == 2 && passing->totalCount == 2,
               "A passing target should report 2/2 with exit 0") && ok;

    const auto silent = runner.run(dir.path(), "silent.sh");
    ok = check(silent && silent->exitCode == 3 && silent->passedCount == 0 && silent->totalCount == 0,
               "A target without a summary is a 0/0 result, not an error") && ok;

    const auto again = runner.run(dir.path(), "ok.sh");
    ok = check(again && again->passedCount == passing->passedCount && again->rawOutput == passing->rawOutput,
               "Running the same target twice gives the same verdict") && ok;
    return ok;
}

bool testTimeoutKillsProcessGroup() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "hang.sh", "sleep 30 &\nsleep 30\n");
    SandboxConfig config = shellConfig();
    config.timeoutMs = 500;
    const SandboxRunner runner(config);

    QElapsedTimer timer;
    timer.start();
    EngineError error;
    const auto result = runner.run(dir.path(), "hang.sh", &error);
    bool ok = true;
    ok = check(!result && error.kind == EngineError::Kind::Timeout,
               "A hanging target should fail with timeout, got " + error.kindName()) && ok;
    ok = check(timer.elapsed() < 10000, QString("Timeout took too long: %1 ms").arg(timer.elapsed())) && ok;
    return ok;
}

bool testMissingRuntime() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "tests.py", "pass\n");
    bool ok = true;

    SandboxConfig local = shellConfig();
    local.localInterpreter = "/nonexistent/pairbench-python";
    EngineError localError;
    ok = check(!SandboxRunner(local).run(dir.path(), "tests.py", &localError) &&
                   localError.kind == EngineError::Kind::EnvironmentUnavailable,
               "A missing interpreter should be environment_unavailable, got " + localError.kindName()) && ok;

    SandboxConfig docker;
    docker.dockerPath = "/nonexistent/pairbench-docker";
    EngineError dockerError;
    ok = check(!SandboxRunner(docker).run(dir.path(), "tests.py", &dockerError) &&
                   dockerError.kind == EngineError::Kind::EnvironmentUnavailable,
               "A missing docker binary should be environment_unavailable, got " + dockerError.kindName()) && ok;
    return ok;
}

bool testRejectsEscapingTarget() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    EngineError error;
    const auto result = SandboxRunner(shellConfig()).run(dir.path(), "../outside.sh", &error);
    return check(!result && error.kind == EngineError::Kind::WorkspaceEscape,
                 "A target outside the sandbox should be a workspace escape");
}

bool testScratchEnvironment() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "env.sh", "echo \"tmp=$TMPDIR\"\necho \"extra=$QUESTION_SEED\"\n");
    SandboxConfig config = shellConfig();
    const SandboxRunner runner(config, nullptr, {{"QUESTION_SEED", "42"}});
    const auto result = runner.run(dir.path(), "env.sh");
    if (!check(result.has_value(), "env.sh should run")) {
        return false;
    }
    bool ok = true;
    ok = check(!result->rawOutput.contains("tmp=\n") && !result->rawOutput.contains("tmp=" + dir.path()),
               "TMPDIR should point at a per-run scratch directory: " + result->rawOutput) && ok;
    ok = check(result->rawOutput.contains("extra=42"), "Question environment should reach the child") && ok;
    return ok;
}

bool testOutputIsCapped() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "noisy.sh", "i=0\nwhile [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done\n");
    SandboxConfig config = shellConfig();
    config.maxOutputBytes = 100;
    const auto result = SandboxRunner(config).run(dir.path(), "noisy.sh");
    return check(result && result->rawOutput.contains("[output truncated after 100 bytes]") &&
                     result->rawOutput.size() < 200,
                 "Output beyond the cap should be truncated");
}

bool testTamperedHiddenTargetIsRestored() {
    QTemporaryDir questions;
    QTemporaryDir scratch;
    if (!check(questions.isValid() && scratch.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    const QByteArray hiddenCheck = "echo 'Ran 2 tests in 0.001s' >&2\n"
                                   "echo 'FAILED (failures=2)' >&2\n"
                                   "exit 1\n";
    const bool written = writeQuestion(questions.path(), "tamper",
        R"({"name": "tamper", "visible_files": ["solution.sh"], "entrypoint": "visible.sh",
            "stages": [{"name": "Only", "visible_tests": ["visible.sh"], "hidden_tests": ["hidden_check.sh"]}]})",
        {{"solution.sh", "\n"},
         {"visible.sh", "chmod u+w hidden_check.sh 2>/dev/null\n"
                        "rm -f hidden_check.sh\n"
                        "printf \"echo 'Ran 2 tests in 0.001s' >&2\\necho OK >&2\\n\" > hidden_check.sh\n"
                        "echo 'Ran 1 test in 0.001s' >&2\n"
                        "echo OK >&2\n"},
         {"hidden_check.sh", hiddenCheck}});
    if (!check(written, "Failed to write question fixture")) {
        return false;
    }

    const QuestionRepository repository(questions.path());
    const WorkspaceMaterializer materializer(scratch.path());
    const ExecutionService service(repository, materializer, ExecutionService::sandboxRunnerFactory(shellConfig()));
    EngineError error;
    const auto outcome = service.runCode("tamper", {}, 0, &error);
    if (!check(outcome.has_value(), "Execution should succeed: " + error.message)) {
        return false;
    }
    const StageRunResult *stage = outcome->aggregate.current();
    bool ok = true;
    ok = check(stage && stage->visiblePassed == 1 && stage->visibleTotal == 1, "The visible target passes") && ok;
    ok = check(stage && stage->hiddenPassed == 0 && stage->hiddenTotal == 2,
               "The hidden verdict must come from the question's own target") && ok;
    ok = check(!outcome->aggregate.currentPassed, "A rewritten hidden target cannot pass the stage") && ok;
    ok = check(readTextFile(QDir(questions.path()).filePath("tamper/hidden_check.sh")) == hiddenCheck,
               "Question assets stay untouched") && ok;
    return ok;
}

bool testBackgroundChildrenDoNotOutliveRun() {
    QTemporaryDir dir;
    QTemporaryDir record;
    if (!check(dir.isValid() && record.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    writeTextFile(dir.path(), "spawn.sh",
                  "sleep 30 >/dev/null 2>&1 &\n"
                  "echo $! > \"$PID_FILE\"\n"
                  "echo 'Ran 1 test in 0.001s' >&2\n"
                  "echo OK >&2\n");
    const QString pidFile = QDir(record.path()).filePath("child.pid");
    const SandboxRunner runner(shellConfig(), nullptr, {{"PID_FILE", pidFile}});
    const auto result = runner.run(dir.path(), "spawn.sh");
    if (!check(result && result->exitCode == 0, "spawn.sh should exit normally")) {
        return false;
    }
    const qint64 pid = readTextFile(pidFile).trimmed().toLongLong();
    if (!check(pid > 0, "The background pid should be recorded")) {
        return false;
    }
    QElapsedTimer timer;
    timer.start();
    while (!processGone(pid) && timer.elapsed() < 3000) {
        QThread::msleep(50);
    }
    return check(processGone(pid), QString("Background child %1 outlived the run").arg(pid));
}

bool testPrintedIsolationMessageIsOrdinaryOutput() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "spoof.sh", "echo 'pairbench: network isolation unavailable' >&2\nexit 125\n");
    EngineError error;
    const auto result = SandboxRunner(shellConfig()).run(dir.path(), "spoof.sh", &error);
    return check(result && result->exitCode == 125 && result->totalCount == 0,
                 "A target exiting 125 is a failing target, not a missing runtime: " + error.kindName());
}

bool testDockerExitCodeNeedsContainer() {
    QTemporaryDir sandbox;
    QTemporaryDir fakeDir(QDir::current().filePath("fake-docker-XXXXXX"));
    if (!check(sandbox.isValid() && fakeDir.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    writeTextFile(sandbox.path(), "tests.py", "pass\n");
    bool ok = true;

    SandboxConfig config;
    config.dockerPath = writeFakeDocker(fakeDir,
        "[ -n \"$cid\" ] && echo fakecontainer > \"$cid\"\n"
        "echo 'Ran 1 test in 0.001s' >&2\n"
        "echo 'FAILED (failures=1)' >&2\n"
        "exit 125\n");
    EngineError containerError;
    const auto container = SandboxRunner(config).run(sandbox.path(), "tests.py", &containerError);
    ok = check(container && container->exitCode == 125 && container->passedCount == 0 && container->totalCount == 1,
               "A container exiting 125 is a failing target: " + containerError.message) && ok;

    config.dockerPath = writeFakeDocker(fakeDir,
        "echo 'docker: Cannot connect to the Docker daemon' >&2\n"
        "exit 125\n");
    EngineError daemonError;
    ok = check(!SandboxRunner(config).run(sandbox.path(), "tests.py", &daemonError) &&
                   daemonError.kind == EngineError::Kind::EnvironmentUnavailable,
               "125 without a container is environment_unavailable, got " + daemonError.kindName()) && ok;
    return ok;
}

bool testTimedOutContainerIsRemoved() {
    QTemporaryDir sandbox;
    QTemporaryDir fakeDir(QDir::current().filePath("fake-docker-XXXXXX"));
    if (!check(sandbox.isValid() && fakeDir.isValid(), "Failed to create temporary directories")) {
        return false;
    }
    writeTextFile(sandbox.path(), "tests.py", "pass\n");

    SandboxConfig config;
    config.dockerPath = "  " + writeFakeDocker(fakeDir, "sleep 30\n") + "  ";
    config.timeoutMs = 500;
    EngineError error;
    bool ok = true;
    ok = check(!SandboxRunner(config).run(sandbox.path(), "tests.py", &error) &&
                   error.kind == EngineError::Kind::Timeout,
               "A hanging container should time out, got " + error.kindName()) && ok;
    ok = check(readTextFile(QDir(fakeDir.path()).filePath("rm.log")).startsWith("rm -f pairbench-"),
               "The timed-out container should be removed with the configured docker binary") && ok;

    SandboxConfig blank;
    blank.dockerPath = "   ";
    ok = check(SandboxRunner(blank).dockerProgram() == "docker", "A blank docker setting falls back to docker") && ok;
    return ok;
}

bool testFloodingOutputKeepsSummary() {
    QTemporaryDir dir;
    if (!check(dir.isValid(), "Failed to create temporary directory")) {
        return false;
    }
    writeTextFile(dir.path(), "flood.sh",
                  "i=0\n"
                  "while [ $i -lt 20000 ]; do echo 0123456789012345678901234567890123456789; i=$((i+1)); done\n"
                  "echo 'Ran 4 tests in 0.100s'\n"
                  "echo OK\n");
    SandboxConfig config = shellConfig();
    config.maxOutputBytes = 1000;
    const auto result = SandboxRunner(config).run(dir.path(), "flood.sh");
    if (!check(result.has_value(), "flood.sh should run")) {
        return false;
    }
    bool ok = true;
    ok = check(result->passedCount == 4 && result->totalCount == 4,
               QString("The trailing summary should survive the cap, got %1/%2")
                   .arg(result->passedCount).arg(result->totalCount)) && ok;
    ok = check(result->rawOutput.contains("[output truncated after 1000 bytes]") && result->rawOutput.size() < 1200,
               "Reported output is capped") && ok;
    return ok;
}

bool testDockerArguments() {
    SandboxConfig config;
    config.environment = {"PYTHONDONTWRITEBYTECODE=1"};
    const SandboxRunner runner(config);
    const QStringList args = runner.dockerArguments("/tmp/ws", "tests/basic.py", "pairbench-abc");

    bool ok = true;
    ok = check(args.mid(0, 4) == (QStringList{"run", "--rm", "--name", "pairbench-abc"}),
               "docker run should start with --rm and the container name") && ok;
    const qsizetype network = args.indexOf("--network");
    ok = check(network >= 0 && args.value(network + 1) == "none", "Networking should be disabled") && ok;
    const qsizetype pids = args.indexOf("--pids-limit");
    ok = check(pids >= 0 && args.value(pids + 1) == "64", "The pids limit should be passed") && ok;
    ok = check(args.contains("/tmp:rw,size=64m"), "A bounded tmpfs should be mounted") && ok;
    ok = check(args.contains("/tmp/ws:/workspace:ro"), "The workspace should be mounted read-only") && ok;
    ok = check(args.contains("PYTHONDONTWRITEBYTECODE=1"), "Configured env should be forwarded") && ok;
    const QStringList withCid = runner.dockerArguments("/tmp/ws", "tests/basic.py", "pairbench-abc", "/tmp/run/container.id");
    const qsizetype cid = withCid.indexOf("--cidfile");
    ok = check(cid >= 0 && withCid.value(cid + 1) == "/tmp/run/container.id", "The cid file should be requested") && ok;
    ok = check(!args.contains("--cidfile"), "No cid file unless one is given") && ok;
    ok = check(args.mid(args.size() - 3) == (QStringList{"python:3.10-slim", "python", "tests/basic.py"}),
               "The command should end with image, interpreter and target: " + args.join(' ')) && ok;
    return ok;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    bool ok = true;
    ok = testFailingSummary() && ok;
    ok = testPassingAndSilentTargets() && ok;
    ok = testTimeoutKillsProcessGroup() && ok;
    ok = testMissingRuntime() && ok;
    ok = testRejectsEscapingTarget() && ok;
    ok = testScratchEnvironment() && ok;
    ok = testOutputIsCapped() && ok;
    ok = testTamperedHiddenTargetIsRestored() && ok;
    ok = testBackgroundChildrenDoNotOutliveRun() && ok;
    ok = testPrintedIsolationMessageIsOrdinaryOutput() && ok;
    ok = testDockerExitCodeNeedsContainer() && ok;
    ok = testTimedOutContainerIsRemoved() && ok;
    ok = testFloodingOutputKeepsSummary() && ok;
    ok = testDockerArguments() && ok;

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
