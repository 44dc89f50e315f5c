#pragma once

#include <QString>

namespace probedock {

enum class ProbeError {
    None,
    ExecutablePathUnavailable,
    NoParentDirectory,
    LaunchFailed,
    OutputCaptureFailed,
    InvalidOutputEncoding,
};

QString probeErrorName(ProbeError error);

}  // namespace probedock
