// src/core/GeoJsonLayerSink.cpp

#include "GeoJsonLayerSink.h"

#include "Validation.h"
#include "util/Log.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace mdi {

namespace {

const char* const kLatitudeFields[]  = { "latitude", "lat", "y" };
const char* const kLongitudeFields[] = { "longitude", "lon", "lng", "x" };

template <std::size_t N>
bool findNumber(const Record& record, const char* const (&names)[N], double& out)
{
    for (const char* name : names) {
        for (const Field& f : record.fields()) {
            if (f.name.compare(QLatin1String(name), Qt::CaseInsensitive) != 0 || f.value.isNull()) {
                continue;
            }
            bool ok = false;
            const double v = f.value.toDouble(&ok);
            if (ok) {
                out = v;
                return true;
            }
        }
    }
    return false;
}

bool isCoordinateField(const QString& name)
{
    for (const char* n : kLatitudeFields) {
        if (name.compare(QLatin1String(n), Qt::CaseInsensitive) == 0) return true;
    }
    for (const char* n : kLongitudeFields) {
        if (name.compare(QLatin1String(n), Qt::CaseInsensitive) == 0) return true;
    }
    return false;
}

} // anonymous namespace

bool extractCoordinates(const Record& record, double& latitude, double& longitude)
{
    return findNumber(record, kLatitudeFields, latitude)
        && findNumber(record, kLongitudeFields, longitude);
}

GeoJsonLayerSink::GeoJsonLayerSink(QDir outputDir)
    : m_dir(std::move(outputDir))
{
}

GeoJsonLayerSink::~GeoJsonLayerSink()
{
    rollback();
}

bool GeoJsonLayerSink::begin(const QString& layerName, const QStringList& /*headers*/, QString* error)
{
    if (!m_dir.exists() && !m_dir.mkpath(QStringLiteral("."))) {
        if (error) *error = QStringLiteral("Cannot create output directory %1").arg(m_dir.path());
        return false;
    }

    m_path    = m_dir.filePath(sanitizeFileName(layerName) + QStringLiteral(".geojson"));
    m_written = 0;
    m_skipped = 0;
    m_file    = std::make_unique<QSaveFile>(m_path);
    if (!m_file->open(QIODevice::WriteOnly)) {
        if (error) *error = m_file->errorString();
        m_file.reset();
        return false;
    }

    // Quoted and escaped layer name.
    QByteArray head = QByteArrayLiteral("{\"type\":\"FeatureCollection\",\"name\":");
    head += QJsonDocument(QJsonArray{ layerName }).toJson(QJsonDocument::Compact).mid(1).chopped(1);
    head += QByteArrayLiteral(",\"features\":[\n");
    if (m_file->write(head) != head.size()) {
        if (error) *error = m_file->errorString();
        rollback();
        return false;
    }
    return true;
}

bool GeoJsonLayerSink::addRecords(const RecordList& chunk, QString* error)
{
    if (!m_file) {
        if (error) *error = QStringLiteral("Layer is not open");
        return false;
    }

    QByteArray out;
    for (const Record& record : chunk) {
        double lat = 0.0;
        double lon = 0.0;
        if (!extractCoordinates(record, lat, lon)) {
            ++m_skipped;
            continue;
        }

        QJsonObject properties;
        for (const Field& f : record.fields()) {
            if (!isCoordinateField(f.name)) {
                properties.insert(f.name, QJsonValue::fromVariant(f.value));
            }
        }
        const QJsonObject feature{
            { QStringLiteral("type"), QStringLiteral("Feature") },
            { QStringLiteral("geometry"), QJsonObject{
                  { QStringLiteral("type"), QStringLiteral("Point") },
                  { QStringLiteral("coordinates"), QJsonArray{ lon, lat } } } },
            { QStringLiteral("properties"), properties },
        };

        if (m_written > 0) {
            out += ",\n";
        }
        out += QJsonDocument(feature).toJson(QJsonDocument::Compact);
        ++m_written;
    }

    if (!out.isEmpty() && m_file->write(out) != out.size()) {
        if (error) *error = m_file->errorString();
        return false;
    }
    return true;
}

bool GeoJsonLayerSink::commit(QString* error)
{
    if (!m_file) {
        if (error) *error = QStringLiteral("Layer is not open");
        return false;
    }
    const QByteArray tail = QByteArrayLiteral("\n]}\n");
    if (m_file->write(tail) != tail.size() || !m_file->commit()) {
        if (error) *error = m_file->errorString();
        m_file.reset();
        return false;
    }
    m_file.reset();
    if (m_skipped > 0) {
        qCInfo(lcImport) << "Skipped" << m_skipped << "record(s) without coordinates";
    }
    return true;
}

void GeoJsonLayerSink::rollback() noexcept
{
    if (m_file) {
        m_file->cancelWriting();
        m_file.reset();
    }
}

} // namespace mdi
