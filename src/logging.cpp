#include "speccle/logging.hpp"

Q_LOGGING_CATEGORY(lcCollector, "speccle.collector", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlatform, "speccle.platform", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUi, "speccle.ui", QtInfoMsg)
