#include "KlineLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "kline.app")
Q_LOGGING_CATEGORY(logData, "kline.data")
Q_LOGGING_CATEGORY(logRender, "kline.render")
Q_LOGGING_CATEGORY(logDebug, "kline.debug", QtWarningMsg)
