#include "timeline/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcLayout, "timeline.layout", QtInfoMsg)
Q_LOGGING_CATEGORY(lcData, "timeline.data", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUi, "timeline.ui", QtInfoMsg)
