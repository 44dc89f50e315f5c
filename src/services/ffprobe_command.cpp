#include "probedock/ffprobe_command.hpp"

#include <utility>

namespace probedock {

FfprobeCommand::FfprobeCommand(QString program)
    : program_(std::move(program)) {}

FfprobeCommand& FfprobeCommand::hideBanner() {
    return arg("-hide_banner");
}

FfprobeCommand& FfprobeCommand::printFormat(const QString& format) {
    arg("-print_format");
    return arg(format);
}

FfprobeCommand& FfprobeCommand::arg(const QString& value) {
    arguments_.append(value);
    return *this;
}

FfprobeCommand& FfprobeCommand::args(const QStringList& values) {
    for (const QString& value : values) {
        arg(value);
    }
    return *this;
}

FfprobeCommand& FfprobeCommand::setHideConsoleWindow(bool hide) {
    hideConsoleWindow_ = hide;
    return *this;
}

CommandResult FfprobeCommand::run(CommandOptions options) const {
    options.hideConsoleWindow = hideConsoleWindow_;
    return CommandRunner::run(program_, arguments_, options);
}

}  // namespace probedock
