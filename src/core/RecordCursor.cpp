// src/core/RecordCursor.cpp

#include "RecordCursor.h"

#include <algorithm>

namespace mdi {

RecordCursor::RecordCursor(RecordList records, QStringList headers)
    : m_records(std::move(records))
    , m_headers(std::move(headers))
{
}

RecordList RecordCursor::nextChunk(int maxCount)
{
    if (maxCount <= 0 || !hasMore()) {
        return {};
    }
    const int count = std::min(maxCount, total() - m_position);
    RecordList chunk = m_records.mid(m_position, count);
    m_position += count;
    return chunk;
}

} // namespace mdi
