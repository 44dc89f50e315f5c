#include "probedock/probe_error.hpp"

namespace probedock {

QString probeErrorName(ProbeError error) {
    switch (error) {
        case ProbeError::None:
            return "none";
        case ProbeError::ExecutablePathUnavailable:
            return "executable_path_unavailable";
        case ProbeError::NoParentDirectory:
            return "no_parent_directory";
        case ProbeError::LaunchFailed:
            return "launch_failed";
        case ProbeError::OutputCaptureFailed:
            return "output_capture_failed";
        case ProbeError::InvalidOutputEncoding:
            return "invalid_output_encoding";
    }
    return "unknown";
}

}  // namespace probedock
