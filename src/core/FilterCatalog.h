// src/core/FilterCatalog.h
//
// Filter vocabulary for the data tabs: parameter names understood by the
// data endpoints, the fixed choice lists, pre-flight filter checks and the
// default layer name derived from a filter.

#pragma once

#include "Types.h"

#include <QVector>

namespace mdi {

namespace filter_keys {
inline const QString kStates            = QStringLiteral("states");
inline const QString kHoleType          = QStringLiteral("hole_type");
inline const QString kCompanies         = QStringLiteral("companies");
inline const QString kMaxDepth          = QStringLiteral("max_depth");
inline const QString kElement           = QStringLiteral("element");
inline const QString kOperator          = QStringLiteral("operator");
inline const QString kValue             = QStringLiteral("value");
inline const QString kFetchAll          = QStringLiteral("fetch_all_records");
inline const QString kFetchOnlyLocation = QStringLiteral("fetch_only_location");
} // namespace filter_keys

struct Choice {
    QString label;
    QString value;
};

QVector<Choice> australianStates();
QVector<Choice> chemicalElements();
QStringList     comparisonOperators();

/// Empty when `filters` can be sent, otherwise a user-facing reason.
/// Fetching everything is only supported one state at a time, and assay
/// queries need an element.
[[nodiscard]] QString validateFilters(DatasetKind kind, const FilterParams& filters, bool fetchAll);

/// e.g. "Holes_WA_BHP_100rec" or "Assays_NSW_au_gt5ppm".  `requestedCount <= 0`
/// means fetch-all and adds no count suffix.  At most 50 characters.
[[nodiscard]] QString defaultLayerName(DatasetKind kind, const FilterParams& filters, qint64 requestedCount);

} // namespace mdi
