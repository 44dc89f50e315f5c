#pragma once

#include <QString>

#include "probedock/ffprobe_command.hpp"
#include "probedock/ffprobe_locator.hpp"
#include "probedock/probe_error.hpp"

namespace probedock {

struct VersionResult {
    // Raw "ffprobe -version" banner; no version number is parsed out of it.
    QString text;
    ProbeError error = ProbeError::None;
    QString errorString;

    [[nodiscard]] bool ok() const { return error == ProbeError::None; }
};

class Ffprobe {
public:
    Ffprobe() = default;
    explicit Ffprobe(FfprobeLocator locator);

    [[nodiscard]] const FfprobeLocator& locator() const { return locator_; }

    // True if the effective binary runs "-version" and exits with 0. Not all
    // FFmpeg distributions ship ffprobe.
    bool isInstalled() const;
    static bool isInstalledAt(const QString& path);

    VersionResult version() const;
    static VersionResult versionAt(const QString& path);

    // Builder preloaded with the effective path.
    FfprobeCommand command() const;

private:
    FfprobeLocator locator_;
};

}  // namespace probedock
