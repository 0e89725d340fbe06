// src/core/GeoJsonLayerSink.h
//
// LayerSink that writes a GeoJSON FeatureCollection of points, one feature
// per record.  The file appears atomically on commit (QSaveFile); a rolled
// back import leaves no file behind.

#pragma once

#include "LayerSink.h"

#include <QDir>
#include <QSaveFile>

#include <memory>

namespace mdi {

/// Finds the coordinate pair in `record`.  Latitude is read from
/// latitude/lat/y and longitude from longitude/lon/lng/x, case-insensitive.
bool extractCoordinates(const Record& record, double& latitude, double& longitude);

class GeoJsonLayerSink final : public LayerSink {
public:
    explicit GeoJsonLayerSink(QDir outputDir);
    ~GeoJsonLayerSink() override;

    bool begin(const QString& layerName, const QStringList& headers, QString* error) override;
    bool addRecords(const RecordList& chunk, QString* error) override;
    bool commit(QString* error) override;
    void rollback() noexcept override;

    [[nodiscard]] qint64 writtenCount() const noexcept override { return m_written; }
    [[nodiscard]] qint64 skippedCount() const noexcept { return m_skipped; }

    /// Path of the layer file; valid after begin().
    [[nodiscard]] QString filePath() const { return m_path; }

private:
    QDir                       m_dir;
    QString                    m_path;
    std::unique_ptr<QSaveFile> m_file;
    qint64                     m_written = 0;
    qint64                     m_skipped = 0;
};

} // namespace mdi
