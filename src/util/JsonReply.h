// src/util/JsonReply.h
//
// Helpers for JSON reply bodies shared by the session, fetch and lookup code.

#pragma once

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

namespace mdi {

/// Parses `body`.  Returns false and fills `error` on malformed JSON.
bool parseJsonBody(const QByteArray& body, QJsonDocument& doc, QString* error = nullptr);

/// Best-effort server error text: `{error: {message}}`, `{error: "..."}`,
/// `{message: "..."}` or `{detail: "..."}`.  Empty when none is present.
QString errorMessageFromBody(const QByteArray& body);

/// Serialises a JSON object literal for request bodies.
QByteArray toJsonBody(const QJsonObject& object);

} // namespace mdi
