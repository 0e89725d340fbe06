// src/core/DatasetStore.h
//
// DatasetStore – per-tab dataset state for Holes and Assays.
//
// Each kind holds the full fetched record set (for import), the display
// prefix shown in the table, table paging and the last applied filter.
// Every mutation replaces or clears a dataset wholesale; there is no
// partial update path.
//
// Invariants (per kind)
// ---------------------
// * displayRecords is the first min(records.size(), displayCeiling)
//   elements of records.
// * currentPage * recordsPerPage < totalRecords whenever totalRecords > 0.

#pragma once

#include "AppConfig.h"
#include "RecordCursor.h"
#include "Types.h"

#include <QObject>

#include <array>

namespace mdi {

struct DatasetState {
    RecordList   records;
    RecordList   displayRecords;
    QStringList  headers;          ///< Raw column names from the server.
    QStringList  displayHeaders;   ///< Title-cased for the table.
    qint64       totalRecords   = 0;
    int          currentPage    = 0;   ///< 0-based table page.
    int          recordsPerPage = 100;
    FilterParams filterParams;
    FetchDetails fetchDetails;

    [[nodiscard]] bool isEmpty() const noexcept { return records.isEmpty(); }

    bool operator==(const DatasetState& other) const
    {
        return records == other.records
            && displayRecords == other.displayRecords
            && headers == other.headers
            && displayHeaders == other.displayHeaders
            && totalRecords == other.totalRecords
            && currentPage == other.currentPage
            && recordsPerPage == other.recordsPerPage
            && filterParams == other.filterParams
            && fetchDetails == other.fetchDetails;
    }
    bool operator!=(const DatasetState& other) const { return !(*this == other); }
};

/// Everything replace() needs besides the records themselves.
struct DatasetMeta {
    qint64       serverTotal = 0;
    FilterParams filterParams;
    FetchDetails fetchDetails;
};

class DatasetStore : public QObject {
    Q_OBJECT

public:
    explicit DatasetStore(const AppConfig& config, QObject* parent = nullptr);
    ~DatasetStore() override;

    [[nodiscard]] const DatasetState& state(DatasetKind kind) const;

    // -----------------------------------------------------------------------
    // Wholesale mutation
    // -----------------------------------------------------------------------

    /// Atomically swap the dataset for `kind`, recompute the display prefix
    /// and reset to the first table page.
    void replace(DatasetKind kind, RecordList records, QStringList headers, const DatasetMeta& meta);

    /// Empty the dataset and forget its filter.
    void clearAll(DatasetKind kind);

    /// Empty the dataset but keep its filter.
    void clearDataOnly(DatasetKind kind);

    /// clearAll() for every kind.  Called right after logout.
    void clearOnLogout();

    void setFilterParams(DatasetKind kind, const FilterParams& params);

    // -----------------------------------------------------------------------
    // Import access
    // -----------------------------------------------------------------------
    [[nodiscard]] RecordCursor cursor(DatasetKind kind) const;

    // -----------------------------------------------------------------------
    // Table paging over the display prefix
    // -----------------------------------------------------------------------
    [[nodiscard]] PaginationInfo paginationInfo(DatasetKind kind) const;
    [[nodiscard]] RecordList     pageRecords(DatasetKind kind) const;

    /// Clamp `page` (1-based) into range and select it.  Returns false when
    /// there is nothing to page through.
    bool navigateToPage(DatasetKind kind, int page);
    bool nextPage(DatasetKind kind);
    bool previousPage(DatasetKind kind);

signals:
    void datasetChanged(mdi::DatasetKind kind);
    void pageChanged(mdi::DatasetKind kind, int page);

private:
    DatasetState&       mutableState(DatasetKind kind);
    [[nodiscard]] int   pageCount(const DatasetState& s) const;
    void                resetData(DatasetState& s);

    const AppConfig&            m_config;
    std::array<DatasetState, 2> m_states;
};

} // namespace mdi
