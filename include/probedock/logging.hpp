#pragma once

#include <QLoggingCategory>

namespace probedock {

// Category "probedock.ffprobe". Enable with QT_LOGGING_RULES="probedock.*.debug=true".
Q_DECLARE_LOGGING_CATEGORY(lcFfprobe)

}  // namespace probedock
