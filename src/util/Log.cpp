// src/util/Log.cpp

#include "Log.h"

Q_LOGGING_CATEGORY(lcConfig,  "mdi.config",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcSession, "mdi.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGateway, "mdi.gateway", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFetch,   "mdi.fetch",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcImport,  "mdi.import",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcLookup,  "mdi.lookup",  QtInfoMsg)
