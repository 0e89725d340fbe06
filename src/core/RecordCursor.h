// src/core/RecordCursor.h
//
// RecordCursor – forward-only, chunked view over a fetched record set.
//
// The import pipeline pulls bounded chunks so it can check for
// cancellation and report progress between them.  A cursor is finite and
// cannot be rewound; take a new one from DatasetStore to start over.  The
// underlying QVector is implicitly shared, so taking a cursor does not copy
// the dataset.

#pragma once

#include "Types.h"

namespace mdi {

class RecordCursor {
public:
    RecordCursor() = default;
    RecordCursor(RecordList records, QStringList headers);

    RecordCursor(const RecordCursor&)            = delete;
    RecordCursor& operator=(const RecordCursor&) = delete;
    RecordCursor(RecordCursor&&) noexcept            = default;
    RecordCursor& operator=(RecordCursor&&) noexcept = default;

    /// Up to `maxCount` records following the previous chunk; empty once
    /// exhausted.
    RecordList nextChunk(int maxCount);

    [[nodiscard]] bool hasMore() const noexcept { return m_position < m_records.size(); }
    [[nodiscard]] int  position() const noexcept { return m_position; }
    [[nodiscard]] int  total() const noexcept { return static_cast<int>(m_records.size()); }

    [[nodiscard]] const QStringList& headers() const noexcept { return m_headers; }

private:
    RecordList  m_records;
    QStringList m_headers;
    int         m_position = 0;
};

} // namespace mdi
