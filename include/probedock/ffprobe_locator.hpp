#pragma once

#include <QString>

#include "probedock/probe_error.hpp"

namespace probedock {

struct SidecarPath {
    QString path;
    ProbeError error = ProbeError::None;
    QString errorString;

    [[nodiscard]] bool ok() const { return error == ProbeError::None; }
};

// Where the binary that will be launched comes from.
struct Location {
    enum class Source {
        Sidecar,
        SystemSearch,
    };

    Source source = Source::SystemSearch;
    QString path;

    [[nodiscard]] bool isSidecar() const { return source == Source::Sidecar; }
};

// Finds ffprobe next to the running executable, falling back to a bare name
// that the OS resolves through PATH at launch time. Nothing is cached: every
// query looks at the filesystem again.
class FfprobeLocator {
public:
    struct Options {
        QString binaryName = "ffprobe";
        // Empty means ask the OS for the current executable.
        QString hostExecutable;
    };

    FfprobeLocator();
    explicit FfprobeLocator(Options options);

    [[nodiscard]] const Options& options() const { return options_; }

    // Expected sidecar location. The file may not exist.
    SidecarPath sidecarPath() const;

    // Never fails; sidecar errors fall back to SystemSearch.
    Location locate() const;
    QString effectivePath() const;

    // "ffprobe.exe" on Windows, "ffprobe" elsewhere.
    static QString sidecarFileName(const QString& binaryName);
    // QCoreApplication when one exists, otherwise asks the OS directly
    // (GetModuleFileNameW, _NSGetExecutablePath, /proc/self/exe). Empty on failure.
    static QString currentExecutablePath();

private:
    Options options_;
};

}  // namespace probedock
