#pragma once

#include <QString>
#include <QStringList>

// Resource and runtime settings for sandboxed test execution, shared by
// SandboxRunner, ExecutionService and ServiceSettings.
struct SandboxConfig {
    enum class Runtime {
        Docker,  // one throwaway container per test target
        Local    // setsid + rlimits + network and mount namespaces, for hosts without Docker
    };

    Runtime runtime = Runtime::Docker;
    int timeoutMs = 10000;
    QStringList environment{QStringLiteral("PYTHONDONTWRITEBYTECODE=1")};
    qint64 maxOutputBytes = 1024 * 1024;

    // Docker runtime
    QString dockerPath = "docker";
    QString image = "python:3.10-slim";
    QString cpuLimit = "1";
    QString memoryLimit = "512m";
    int pidsLimit = 64;
    QString tmpfsSize = "64m";
    QString interpreter = "python";  // command inside the container

    // Local runtime
    QString localInterpreter = "python3";
    qint64 localMemoryBytes = 512LL * 1024 * 1024;
    int localCpuSeconds = 10;
    qint64 localScratchBytes = 64LL * 1024 * 1024;
    int localProcessLimit = 64;  // 0 disables RLIMIT_NPROC
    bool isolateNetwork = true;
    bool isolateFilesystem = true;  // private mount namespace with the workspace bound read-only

    static QString runtimeName(Runtime runtime) {
        return runtime == Runtime::Local ? QStringLiteral("local") : QStringLiteral("docker");
    }

    static Runtime runtimeFromName(const QString &name) {
        return name.trimmed().toLower() == "local" ? Runtime::Local : Runtime::Docker;
    }
};
