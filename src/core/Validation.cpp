// src/core/Validation.cpp

#include "Validation.h"

#include <QRegularExpression>
#include <QStringList>

namespace mdi {

namespace {

const QString kInvalidNameChars = QStringLiteral("<>:\"|?*/\\");

} // anonymous namespace

bool isValidEmail(const QString& email)
{
    static const QRegularExpression re(QStringLiteral("^[^@\\s]+@[^@\\s]+\\.[^@\\s]+$"));
    return re.match(email.trimmed()).hasMatch();
}

QString validateLayerName(const QString& name)
{
    if (name.trimmed().isEmpty()) {
        return QStringLiteral("Layer name cannot be empty.");
    }
    for (const QChar c : kInvalidNameChars) {
        if (name.contains(c)) {
            return QStringLiteral("Layer name cannot contain '%1' character.").arg(c);
        }
    }
    return QString();
}

QString sanitizeFileName(const QString& name)
{
    QString out = name;
    for (const QChar c : kInvalidNameChars) {
        out.replace(c, QLatin1Char('_'));
    }
    return out.simplified();
}

QString formatColumnName(const QString& column)
{
    QStringList words = column.split(QLatin1Char('_'), Qt::SkipEmptyParts);
    for (QString& w : words) {
        w = w.toLower();
        w[0] = w[0].toUpper();
    }
    return words.join(QLatin1Char(' '));
}

} // namespace mdi
