// src/core/LayerSink.h
//
// Host layer boundary.  ImportPipeline streams chunks into a sink; the sink
// decides what a "layer" is (a GeoJSON file, a GIS layer, a test recorder).
//
// Call order: begin, addRecords*, then exactly one of commit or rollback.

#pragma once

#include "Types.h"

namespace mdi {

class LayerSink {
public:
    virtual ~LayerSink() = default;

    virtual bool begin(const QString& layerName, const QStringList& headers, QString* error) = 0;
    virtual bool addRecords(const RecordList& chunk, QString* error) = 0;
    virtual bool commit(QString* error) = 0;

    /// Discard everything written since begin().  Must be safe to call in
    /// any state.
    virtual void rollback() noexcept = 0;

    /// Records accepted so far.
    [[nodiscard]] virtual qint64 writtenCount() const noexcept = 0;
};

} // namespace mdi
