#include "probedock/ffprobe_locator.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#include <utility>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>

#include <cstdint>
#endif

#include "probedock/logging.hpp"

namespace probedock {

FfprobeLocator::FfprobeLocator() = default;

FfprobeLocator::FfprobeLocator(Options options)
    : options_(std::move(options)) {}

QString FfprobeLocator::sidecarFileName(const QString& binaryName) {
#ifdef _WIN32
    return QFileInfo(binaryName).completeBaseName() + ".exe";
#else
    return binaryName;
#endif
}

namespace {

QString queryExecutablePath() {
#ifdef _WIN32
    std::vector<wchar_t> buffer(MAX_PATH);
    for (;;) {
        const DWORD size = static_cast<DWORD>(buffer.size());
        const DWORD written = GetModuleFileNameW(nullptr, buffer.data(), size);
        if (written == 0) {
            return {};
        }
        if (written < size) {
            return QString::fromWCharArray(buffer.data(), static_cast<int>(written));
        }
        buffer.resize(buffer.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buffer(size + 1, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
        return {};
    }
    return QString::fromUtf8(buffer.data());
#elif defined(__linux__)
    return QFileInfo("/proc/self/exe").symLinkTarget();
#else
    return {};
#endif
}

}  // namespace

QString FfprobeLocator::currentExecutablePath() {
    if (QCoreApplication::instance() != nullptr) {
        return QCoreApplication::applicationFilePath();
    }
    const QString raw = queryExecutablePath();
    if (raw.isEmpty()) {
        return {};
    }
    const QString canonical = QFileInfo(raw).canonicalFilePath();
    return canonical.isEmpty() ? raw : canonical;
}

SidecarPath FfprobeLocator::sidecarPath() const {
    const QString exePath = options_.hostExecutable.isEmpty()
        ? currentExecutablePath()
        : options_.hostExecutable;

    SidecarPath out;
    if (exePath.isEmpty()) {
        out.error = ProbeError::ExecutablePathUnavailable;
        out.errorString = "Unable to determine the current executable path.";
        return out;
    }

    // cleanPath drops trailing separators, so only a root like "/" has no file name.
    const QFileInfo exeInfo(QDir::cleanPath(exePath));
    if (exeInfo.fileName().isEmpty()) {
        out.error = ProbeError::NoParentDirectory;
        out.errorString = QString("Executable path has no parent directory: %1").arg(exePath);
        return out;
    }

    out.path = QDir(exeInfo.absolutePath()).filePath(sidecarFileName(options_.binaryName));
    return out;
}

Location FfprobeLocator::locate() const {
    const Location fallback{Location::Source::SystemSearch, options_.binaryName};

    const SidecarPath sidecar = sidecarPath();
    if (!sidecar.ok()) {
        qCDebug(lcFfprobe) << "no sidecar location:" << sidecar.errorString
                           << "- using" << fallback.path << "from PATH";
        return fallback;
    }
    if (!QFileInfo::exists(sidecar.path)) {
        qCDebug(lcFfprobe) << "no sidecar at" << sidecar.path
                           << "- using" << fallback.path << "from PATH";
        return fallback;
    }

    qCDebug(lcFfprobe) << "using sidecar" << sidecar.path;
    return {Location::Source::Sidecar, sidecar.path};
}

QString FfprobeLocator::effectivePath() const {
    return locate().path;
}

}  // namespace probedock
