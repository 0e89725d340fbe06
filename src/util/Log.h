// src/util/Log.h
//
// Logging categories for the importer core.  Enable verbose output with
// e.g. QT_LOGGING_RULES="mdi.*.debug=true".
//
// Tokens and passwords must never be passed to these categories.

#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcGateway)
Q_DECLARE_LOGGING_CATEGORY(lcFetch)
Q_DECLARE_LOGGING_CATEGORY(lcImport)
Q_DECLARE_LOGGING_CATEGORY(lcLookup)
