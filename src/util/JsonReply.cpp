// src/util/JsonReply.cpp

#include "JsonReply.h"

#include <QJsonObject>
#include <QJsonParseError>

namespace mdi {

bool parseJsonBody(const QByteArray& body, QJsonDocument& doc, QString* error)
{
    QJsonParseError parseError;
    doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = QStringLiteral("Invalid JSON response: %1").arg(parseError.errorString());
        }
        return false;
    }
    return true;
}

QString errorMessageFromBody(const QByteArray& body)
{
    QJsonDocument doc;
    if (body.isEmpty() || !parseJsonBody(body, doc) || !doc.isObject()) {
        return QString();
    }
    const QJsonObject obj = doc.object();

    const QJsonValue error = obj.value(QStringLiteral("error"));
    if (error.isObject()) {
        const QString msg = error.toObject().value(QStringLiteral("message")).toString();
        if (!msg.isEmpty()) {
            return msg;
        }
    } else if (error.isString()) {
        return error.toString();
    }

    for (const char* key : { "message", "detail" }) {
        const QString msg = obj.value(QLatin1String(key)).toString();
        if (!msg.isEmpty()) {
            return msg;
        }
    }
    return QString();
}

QByteArray toJsonBody(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

} // namespace mdi
