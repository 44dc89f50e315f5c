#pragma once

#include <QString>
#include <QStringList>

#include "probedock/command_runner.hpp"

namespace probedock {

// Argument builder for an ffprobe invocation. Tokens are appended verbatim in
// call order; see https://ffmpeg.org/ffprobe.html for the full option list.
class FfprobeCommand {
public:
    explicit FfprobeCommand(QString program);

    // -hide_banner: suppress the copyright notice, build options and library versions.
    FfprobeCommand& hideBanner();
    // -print_format <writer>: select the output writer (json, xml, csv, flat, ini, default).
    FfprobeCommand& printFormat(const QString& format);

    FfprobeCommand& arg(const QString& value);
    FfprobeCommand& args(const QStringList& values);

    FfprobeCommand& setHideConsoleWindow(bool hide);

    [[nodiscard]] const QString& program() const { return program_; }
    [[nodiscard]] const QStringList& arguments() const { return arguments_; }
    [[nodiscard]] bool hideConsoleWindow() const { return hideConsoleWindow_; }

    // Blocks until ffprobe exits. options.hideConsoleWindow is taken from the builder.
    CommandResult run(CommandOptions options = {}) const;

private:
    QString program_;
    QStringList arguments_;
    bool hideConsoleWindow_ = true;
};

}  // namespace probedock
