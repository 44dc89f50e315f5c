#include "probedock/logging.hpp"

namespace probedock {

Q_LOGGING_CATEGORY(lcFfprobe, "probedock.ffprobe", QtInfoMsg)

}  // namespace probedock
