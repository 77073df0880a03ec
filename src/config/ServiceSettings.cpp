#include "config/ServiceSettings.h"
#include "core/Logging.h"

#include <QSettings>

ServiceSettings ServiceSettings::load(QSettings &settings) {
    ServiceSettings result;

    settings.beginGroup("server");
    result.port = static_cast<quint16>(settings.value("port", result.port).toUInt());
    result.questionsRoot = settings.value("questions_root", result.questionsRoot).toString();
    result.scratchRoot = settings.value("scratch_root", result.scratchRoot).toString();
    result.journalDir = settings.value("journal_dir", result.journalDir).toString();
    settings.endGroup();

    SandboxConfig &sandbox = result.sandbox;
    settings.beginGroup("sandbox");
    sandbox.runtime = SandboxConfig::runtimeFromName(
        settings.value("runtime", SandboxConfig::runtimeName(sandbox.runtime)).toString());
    // A run without a wall-clock limit could hold a worker forever.
    const int timeoutMs = settings.value("timeout_ms", sandbox.timeoutMs).toInt();
    if (timeoutMs > 0) {
        sandbox.timeoutMs = timeoutMs;
    } else {
        qCWarning(lcExecution) << "Ignoring sandbox timeout_ms" << timeoutMs << "; keeping" << sandbox.timeoutMs;
    }
    sandbox.maxOutputBytes = settings.value("max_output_bytes", sandbox.maxOutputBytes).toLongLong();
    sandbox.dockerPath = settings.value("docker", sandbox.dockerPath).toString();
    sandbox.image = settings.value("image", sandbox.image).toString();
    sandbox.cpuLimit = settings.value("cpus", sandbox.cpuLimit).toString();
    sandbox.memoryLimit = settings.value("memory", sandbox.memoryLimit).toString();
    sandbox.pidsLimit = settings.value("pids_limit", sandbox.pidsLimit).toInt();
    sandbox.tmpfsSize = settings.value("tmpfs_size", sandbox.tmpfsSize).toString();
    sandbox.interpreter = settings.value("interpreter", sandbox.interpreter).toString();
    sandbox.localInterpreter = settings.value("local_interpreter", sandbox.localInterpreter).toString();
    sandbox.localMemoryBytes = settings.value("memory_bytes", sandbox.localMemoryBytes).toLongLong();
    sandbox.localCpuSeconds = settings.value("cpu_seconds", sandbox.localCpuSeconds).toInt();
    sandbox.localScratchBytes = settings.value("scratch_bytes", sandbox.localScratchBytes).toLongLong();
    sandbox.localProcessLimit = settings.value("process_limit", sandbox.localProcessLimit).toInt();
    sandbox.isolateNetwork = settings.value("isolate_network", sandbox.isolateNetwork).toBool();
    sandbox.isolateFilesystem = settings.value("isolate_filesystem", sandbox.isolateFilesystem).toBool();
    settings.endGroup();

    settings.beginGroup("session");
    result.sessionLimits.defaultMinutes = settings.value("default_minutes", result.sessionLimits.defaultMinutes).toInt();
    result.sessionLimits.minMinutes = settings.value("min_minutes", result.sessionLimits.minMinutes).toInt();
    result.sessionLimits.maxMinutes = settings.value("max_minutes", result.sessionLimits.maxMinutes).toInt();
    settings.endGroup();

    settings.beginGroup("coach");
    result.coach.idleSeconds = settings.value("idle_seconds", result.coach.idleSeconds).toDouble();
    result.coach.levelWallSeconds = settings.value("level_wall_seconds", result.coach.levelWallSeconds).toDouble();
    result.coach.backtrackRatio = settings.value("backtrack_ratio", result.coach.backtrackRatio).toDouble();
    result.coach.cooldownSeconds = settings.value("cooldown_seconds", result.coach.cooldownSeconds).toDouble();
    settings.endGroup();

    result.loggingRules = settings.value("logging/rules", result.loggingRules).toString();
    return result;
}

void ServiceSettings::save(QSettings &settings) const {
    settings.beginGroup("server");
    settings.setValue("port", port);
    settings.setValue("questions_root", questionsRoot);
    settings.setValue("scratch_root", scratchRoot);
    settings.setValue("journal_dir", journalDir);
    settings.endGroup();

    settings.beginGroup("sandbox");
    settings.setValue("runtime", SandboxConfig::runtimeName(sandbox.runtime));
    settings.setValue("timeout_ms", sandbox.timeoutMs);
    settings.setValue("max_output_bytes", sandbox.maxOutputBytes);
    settings.setValue("docker", sandbox.dockerPath);
    settings.setValue("image", sandbox.image);
    settings.setValue("cpus", sandbox.cpuLimit);
    settings.setValue("memory", sandbox.memoryLimit);
    settings.setValue("pids_limit", sandbox.pidsLimit);
    settings.setValue("tmpfs_size", sandbox.tmpfsSize);
    settings.setValue("interpreter", sandbox.interpreter);
    settings.setValue("local_interpreter", sandbox.localInterpreter);
    settings.setValue("memory_bytes", sandbox.localMemoryBytes);
    settings.setValue("cpu_seconds", sandbox.localCpuSeconds);
    settings.setValue("scratch_bytes", sandbox.localScratchBytes);
    settings.setValue("process_limit", sandbox.localProcessLimit);
    settings.setValue("isolate_network", sandbox.isolateNetwork);
    settings.setValue("isolate_filesystem", sandbox.isolateFilesystem);
    settings.endGroup();

    settings.beginGroup("session");
    settings.setValue("default_minutes", sessionLimits.defaultMinutes);
    settings.setValue("min_minutes", sessionLimits.minMinutes);
    settings.setValue("max_minutes", sessionLimits.maxMinutes);
    settings.endGroup();

    settings.beginGroup("coach");
    settings.setValue("idle_seconds", coach.idleSeconds);
    settings.setValue("level_wall_seconds", coach.levelWallSeconds);
    settings.setValue("backtrack_ratio", coach.backtrackRatio);
    settings.setValue("cooldown_seconds", coach.cooldownSeconds);
    settings.endGroup();

    settings.setValue("logging/rules", loggingRules);
}
