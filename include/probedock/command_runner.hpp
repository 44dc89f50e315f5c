#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>

namespace probedock {

// The install check and version query use the defaults. Callers of
// FfprobeCommand::run() set timeoutMs to bound a probe of a slow or remote
// input, and extraEnv for variables ffprobe reads (AV_LOG_FORCE_NOCOLOR,
// http_proxy, ...).
struct CommandOptions {
    // -1 blocks until the child exits.
    int timeoutMs = -1;
    bool discardOutput = false;
    bool hideConsoleWindow = true;
    // Merged over the system environment.
    QMap<QString, QString> extraEnv;
};

struct CommandResult {
    bool started = false;
    bool finished = false;
    bool crashed = false;
    bool timedOut = false;
    int exitCode = -1;
    QByteArray stdoutData;
    QByteArray stderrData;
    QString errorString;

    [[nodiscard]] bool success() const { return finished && !crashed && exitCode == 0; }
};

class CommandRunner {
public:
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        const CommandOptions& options = {});
};

}  // namespace probedock
