// src/core/DatasetStore.cpp

#include "DatasetStore.h"

#include "Validation.h"

#include <algorithm>

namespace mdi {

DatasetStore::DatasetStore(const AppConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    qRegisterMetaType<mdi::DatasetKind>();
    for (auto& s : m_states) {
        s.recordsPerPage = m_config.recordsPerTablePage;
    }
}

DatasetStore::~DatasetStore() = default;

const DatasetState& DatasetStore::state(DatasetKind kind) const
{
    return m_states[static_cast<std::size_t>(kind)];
}

DatasetState& DatasetStore::mutableState(DatasetKind kind)
{
    return m_states[static_cast<std::size_t>(kind)];
}

// ===========================================================================
// Wholesale mutation
// ===========================================================================

void DatasetStore::replace(DatasetKind kind, RecordList records, QStringList headers, const DatasetMeta& meta)
{
    DatasetState next;
    next.records        = std::move(records);
    const int shown     = std::min(static_cast<int>(next.records.size()), m_config.displayCeiling);
    next.displayRecords = next.records.mid(0, shown);
    next.headers        = std::move(headers);
    for (const QString& h : next.headers) {
        next.displayHeaders.append(formatColumnName(h));
    }
    next.totalRecords   = std::max<qint64>(meta.serverTotal, next.records.size());
    next.currentPage    = 0;
    next.recordsPerPage = m_config.recordsPerTablePage;
    next.filterParams   = meta.filterParams;
    next.fetchDetails   = meta.fetchDetails;

    mutableState(kind) = std::move(next);
    emit datasetChanged(kind);
}

void DatasetStore::resetData(DatasetState& s)
{
    s.records.clear();
    s.displayRecords.clear();
    s.headers.clear();
    s.displayHeaders.clear();
    s.totalRecords   = 0;
    s.currentPage    = 0;
    s.recordsPerPage = m_config.recordsPerTablePage;
    s.fetchDetails   = FetchDetails{};
}

void DatasetStore::clearAll(DatasetKind kind)
{
    DatasetState& s = mutableState(kind);
    resetData(s);
    s.filterParams.clear();
    emit datasetChanged(kind);
}

void DatasetStore::clearDataOnly(DatasetKind kind)
{
    resetData(mutableState(kind));
    emit datasetChanged(kind);
}

void DatasetStore::clearOnLogout()
{
    for (DatasetKind kind : kAllDatasetKinds) {
        clearAll(kind);
    }
}

void DatasetStore::setFilterParams(DatasetKind kind, const FilterParams& params)
{
    mutableState(kind).filterParams = params;
}

RecordCursor DatasetStore::cursor(DatasetKind kind) const
{
    const DatasetState& s = state(kind);
    return RecordCursor(s.records, s.headers);
}

// ===========================================================================
// Paging
// ===========================================================================

int DatasetStore::pageCount(const DatasetState& s) const
{
    const int shown = static_cast<int>(s.displayRecords.size());
    if (shown == 0 || s.recordsPerPage <= 0) {
        return 0;
    }
    return (shown + s.recordsPerPage - 1) / s.recordsPerPage;
}

PaginationInfo DatasetStore::paginationInfo(DatasetKind kind) const
{
    const DatasetState& s = state(kind);
    PaginationInfo info;
    info.recordsPerPage = s.recordsPerPage;
    info.totalRecords   = s.records.size();
    info.displayCount   = static_cast<int>(s.displayRecords.size());
    if (s.records.isEmpty()) {
        return info;
    }
    info.hasData        = true;
    info.totalPages     = std::max(1, pageCount(s));
    info.currentPage    = s.currentPage + 1;
    info.showingRecords = std::min(s.recordsPerPage, info.displayCount - s.currentPage * s.recordsPerPage);
    return info;
}

RecordList DatasetStore::pageRecords(DatasetKind kind) const
{
    const DatasetState& s = state(kind);
    return s.displayRecords.mid(s.currentPage * s.recordsPerPage, s.recordsPerPage);
}

bool DatasetStore::navigateToPage(DatasetKind kind, int page)
{
    DatasetState& s = mutableState(kind);
    const int pages = pageCount(s);
    if (pages == 0) {
        return false;
    }
    const int clamped = std::clamp(page, 1, pages);
    if (clamped - 1 != s.currentPage) {
        s.currentPage = clamped - 1;
        emit pageChanged(kind, clamped);
    }
    return true;
}

bool DatasetStore::nextPage(DatasetKind kind)
{
    return navigateToPage(kind, state(kind).currentPage + 2);
}

bool DatasetStore::previousPage(DatasetKind kind)
{
    return navigateToPage(kind, state(kind).currentPage);
}

} // namespace mdi
