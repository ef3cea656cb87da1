#include "beo_log.h"

Q_LOGGING_CATEGORY(beoLog, "phi-core.adapters.beo")
Q_LOGGING_CATEGORY(beoSocketLog, "phi-core.adapters.beo.websocket")
Q_LOGGING_CATEGORY(beoLinkLog, "phi-core.adapters.beo.beolink")
Q_LOGGING_CATEGORY(beoEventLog, "phi-core.adapters.beo.events")
