#include "probedock/ffprobe.hpp"

#include <QStringDecoder>

#include <utility>

#include "probedock/command_runner.hpp"
#include "probedock/logging.hpp"

namespace probedock {

Ffprobe::Ffprobe(FfprobeLocator locator)
    : locator_(std::move(locator)) {}

bool Ffprobe::isInstalled() const {
    return isInstalledAt(locator_.effectivePath());
}

bool Ffprobe::isInstalledAt(const QString& path) {
    CommandOptions options;
    options.discardOutput = true;
    return CommandRunner::run(path, {"-version"}, options).success();
}

VersionResult Ffprobe::version() const {
    return versionAt(locator_.effectivePath());
}

VersionResult Ffprobe::versionAt(const QString& path) {
    const CommandResult run = CommandRunner::run(path, {"-version"});

    VersionResult out;
    if (!run.started) {
        out.error = ProbeError::LaunchFailed;
        out.errorString = QString("Failed to start %1: %2").arg(path, run.errorString);
        return out;
    }
    if (!run.finished) {
        out.error = ProbeError::OutputCaptureFailed;
        out.errorString = QString("Failed to collect output of %1: %2").arg(path, run.errorString);
        return out;
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder.decode(run.stdoutData);
    if (decoder.hasError()) {
        out.error = ProbeError::InvalidOutputEncoding;
        out.errorString = QString("Output of %1 is not valid UTF-8.").arg(path);
        qCWarning(lcFfprobe) << out.errorString;
        return out;
    }

    out.text = text;
    return out;
}

FfprobeCommand Ffprobe::command() const {
    return FfprobeCommand(locator_.effectivePath());
}

}  // namespace probedock
