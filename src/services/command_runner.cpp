#include "probedock/command_runner.hpp"

#include <QProcess>
#include <QProcessEnvironment>

#ifdef _WIN32
#include <windows.h>
#endif

#include "probedock/logging.hpp"

namespace probedock {

namespace {
void applyConsoleWindowPolicy(QProcess& process, bool hideConsoleWindow) {
#ifdef _WIN32
    if (hideConsoleWindow) {
        process.setCreateProcessArgumentsModifier([](QProcess::CreateProcessArguments* args) {
            args->flags |= CREATE_NO_WINDOW;
        });
    }
#else
    Q_UNUSED(process);
    Q_UNUSED(hideConsoleWindow);
#endif
}
}  // namespace

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    const CommandOptions& options) {
    QProcess process;
    if (!options.extraEnv.isEmpty()) {
        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        for (auto it = options.extraEnv.constBegin(); it != options.extraEnv.constEnd(); ++it) {
            env.insert(it.key(), it.value());
        }
        process.setProcessEnvironment(env);
    }
    if (options.discardOutput) {
        process.setStandardOutputFile(QProcess::nullDevice());
        process.setStandardErrorFile(QProcess::nullDevice());
    }
    applyConsoleWindowPolicy(process, options.hideConsoleWindow);

    qCDebug(lcFfprobe) << "launching" << program << args;
    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(options.timeoutMs)) {
        result.errorString = process.errorString();
        qCWarning(lcFfprobe) << "failed to start" << program << ":" << result.errorString;
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(options.timeoutMs)) {
        if (process.error() == QProcess::Timedout) {
            process.kill();
            process.waitForFinished(500);
            result.timedOut = true;
            result.errorString = "Command timed out.";
            qCWarning(lcFfprobe) << program << "timed out after" << options.timeoutMs << "ms";
        } else {
            result.errorString = process.errorString();
            qCWarning(lcFfprobe) << "lost track of" << program << ":" << result.errorString;
        }
        return result;
    }

    result.finished = true;
    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();
    if (!options.discardOutput) {
        result.stdoutData = process.readAllStandardOutput();
        result.stderrData = process.readAllStandardError();
    }
    if (result.crashed) {
        result.errorString = process.errorString();
    }
    return result;
}

}  // namespace probedock
