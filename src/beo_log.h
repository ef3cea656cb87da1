#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(beoLog)
Q_DECLARE_LOGGING_CATEGORY(beoSocketLog)
Q_DECLARE_LOGGING_CATEGORY(beoLinkLog)
Q_DECLARE_LOGGING_CATEGORY(beoEventLog)
