// tests/unit/validation_test.cpp

#include "core/FilterCatalog.h"
#include "core/Validation.h"

#include <cassert>
#include <iostream>

using namespace mdi;

namespace {

void TestEmail()
{
    assert(isValidEmail(QStringLiteral("geo@example.com")));
    assert(isValidEmail(QStringLiteral("first.last+tag@mine.com.au")));
    assert(!isValidEmail(QString()));
    assert(!isValidEmail(QStringLiteral("geo@example")));
    assert(!isValidEmail(QStringLiteral("geo example@x.com")));
    assert(!isValidEmail(QStringLiteral("@example.com")));
}

void TestLayerNames()
{
    assert(validateLayerName(QStringLiteral("Holes_WA_100rec")).isEmpty());
    assert(!validateLayerName(QStringLiteral("  ")).isEmpty());
    for (const char* bad : { "a<b", "a>b", "a:b", "a\"b", "a|b", "a?b", "a*b", "a/b", "a\\b" }) {
        assert(!validateLayerName(QString::fromLatin1(bad)).isEmpty());
    }
    assert(sanitizeFileName(QStringLiteral("  WA: holes/2024  ")) == QStringLiteral("WA_ holes_2024"));
}

void TestColumnTitles()
{
    assert(formatColumnName(QStringLiteral("hole_id")) == QStringLiteral("Hole Id"));
    assert(formatColumnName(QStringLiteral("MAX_DEPTH")) == QStringLiteral("Max Depth"));
    assert(formatColumnName(QStringLiteral("__lat__")) == QStringLiteral("Lat"));
    assert(formatColumnName(QString()).isEmpty());
}

void TestFilterChecks()
{
    FilterParams filters;
    assert(validateFilters(DatasetKind::Holes, filters, false).isEmpty());
    assert(!validateFilters(DatasetKind::Holes, filters, true).isEmpty());

    filters.insert(filter_keys::kStates, QStringList{ QStringLiteral("WA") });
    assert(validateFilters(DatasetKind::Holes, filters, true).isEmpty());
    filters.insert(filter_keys::kStates, QStringList{ QStringLiteral("WA"), QStringLiteral("SA") });
    assert(!validateFilters(DatasetKind::Holes, filters, true).isEmpty());

    assert(!validateFilters(DatasetKind::Assays, filters, false).isEmpty());
    filters.insert(filter_keys::kElement, QStringLiteral("au"));
    assert(validateFilters(DatasetKind::Assays, filters, false).isEmpty());

    filters.insert(filter_keys::kMaxDepth, QStringLiteral("deep"));
    assert(!validateFilters(DatasetKind::Holes, filters, false).isEmpty());
    filters.insert(filter_keys::kMaxDepth, -5);
    assert(!validateFilters(DatasetKind::Holes, filters, false).isEmpty());
    filters.insert(filter_keys::kMaxDepth, 300);
    assert(validateFilters(DatasetKind::Holes, filters, false).isEmpty());
}

void TestChoiceLists()
{
    assert(australianStates().size() == 7);
    assert(comparisonOperators().size() == 6);

    bool sawGold = false;
    for (const Choice& c : chemicalElements()) {
        assert(c.value == c.value.toLower());
        if (c.value == QLatin1String("au")) {
            sawGold = c.label == QStringLiteral("Gold - Au");
        }
    }
    assert(sawGold);
}

void TestDefaultLayerNames()
{
    FilterParams holes;
    holes.insert(filter_keys::kStates, QStringList{ QStringLiteral("WA") });
    holes.insert(filter_keys::kCompanies, QStringList{ QStringLiteral("BHP") });
    assert(defaultLayerName(DatasetKind::Holes, holes, 100) == QStringLiteral("Holes_WA_BHP_100rec"));
    assert(defaultLayerName(DatasetKind::Holes, holes, 0) == QStringLiteral("Holes_WA_BHP"));

    holes.insert(filter_keys::kStates, QStringList{ QStringLiteral("WA"), QStringLiteral("SA"),
                                                    QStringLiteral("NT"), QStringLiteral("QLD") });
    holes.insert(filter_keys::kCompanies, QStringList{ QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C") });
    holes.insert(filter_keys::kFetchOnlyLocation, true);
    assert(defaultLayerName(DatasetKind::Holes, holes, 0) == QStringLiteral("Holes_4States_3Cos_LocationOnly"));

    FilterParams assays;
    assays.insert(filter_keys::kStates, QStringList{ QStringLiteral("NSW") });
    assays.insert(filter_keys::kElement, QStringLiteral("au"));
    assays.insert(filter_keys::kOperator, QStringLiteral(">"));
    assays.insert(filter_keys::kValue, QStringLiteral("5"));
    const QString name = defaultLayerName(DatasetKind::Assays, assays, 0);
    assert(name == QStringLiteral("Assays_NSW_au_gt5ppm"));
    assert(validateLayerName(name).isEmpty());

    assays.insert(filter_keys::kOperator, QStringLiteral("<="));
    assert(validateLayerName(defaultLayerName(DatasetKind::Assays, assays, 10)).isEmpty());

    FilterParams wordy;
    wordy.insert(filter_keys::kCompanies, QStringList{ QStringLiteral("Extraordinarily Long Mining Company"),
                                                       QStringLiteral("Another Very Long Company Name") });
    wordy.insert(filter_keys::kStates, QStringList{ QStringLiteral("NSW"), QStringLiteral("QLD"), QStringLiteral("VIC") });
    wordy.insert(filter_keys::kFetchOnlyLocation, true);
    const QString truncated = defaultLayerName(DatasetKind::Holes, wordy, 1234567);
    assert(truncated.size() == 50);
    assert(truncated.endsWith(QStringLiteral("...")));
}

} // namespace

int main()
{
    TestEmail();
    TestLayerNames();
    TestColumnTitles();
    TestFilterChecks();
    TestChoiceLists();
    TestDefaultLayerNames();
    std::cout << "mdi_unit_validation: pass\n";
    return 0;
}
