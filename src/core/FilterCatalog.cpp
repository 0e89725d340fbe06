// src/core/FilterCatalog.cpp

#include "FilterCatalog.h"

namespace mdi {

namespace {

constexpr int kMaxLayerNameLength = 50;

QStringList listValue(const FilterParams& filters, const QString& key)
{
    QStringList out;
    const QVariant v = filters.value(key);
    const QStringList raw = v.typeId() == QMetaType::QString
        ? v.toString().split(QLatin1Char(','), Qt::SkipEmptyParts)
        : v.toStringList();
    for (const QString& s : raw) {
        if (!s.trimmed().isEmpty()) {
            out.append(s.trimmed());
        }
    }
    return out;
}

// Comparison operators contain characters that are not allowed in layer
// names.
QString operatorTag(const QString& op)
{
    if (op == QLatin1String(">"))  return QStringLiteral("gt");
    if (op == QLatin1String("<"))  return QStringLiteral("lt");
    if (op == QLatin1String(">=")) return QStringLiteral("gte");
    if (op == QLatin1String("<=")) return QStringLiteral("lte");
    if (op == QLatin1String("!=")) return QStringLiteral("ne");
    return QStringLiteral("eq");
}

} // anonymous namespace

QVector<Choice> australianStates()
{
    return {
        { QStringLiteral("New South Wales"),    QStringLiteral("NSW") },
        { QStringLiteral("Queensland"),         QStringLiteral("QLD") },
        { QStringLiteral("South Australia"),    QStringLiteral("SA") },
        { QStringLiteral("Tasmania"),           QStringLiteral("TAS") },
        { QStringLiteral("Victoria"),           QStringLiteral("VIC") },
        { QStringLiteral("Western Australia"),  QStringLiteral("WA") },
        { QStringLiteral("Northern Territory"), QStringLiteral("NT") },
    };
}

QVector<Choice> chemicalElements()
{
    static const char* const kElements[][2] = {
        { "Silver", "ag" },     { "Aluminum", "al" },   { "Arsenic", "as" },    { "Gold", "au" },
        { "Boron", "b" },       { "Barium", "ba" },     { "Beryllium", "be" },  { "Bismuth", "bi" },
        { "Carbon", "c" },      { "Calcium", "ca" },    { "Cadmium", "cd" },    { "Cerium", "ce" },
        { "Chlorine", "cl" },   { "Cobalt", "co" },     { "Chromium", "cr" },   { "Cesium", "cs" },
        { "Copper", "cu" },     { "Dysprosium", "dy" }, { "Erbium", "er" },     { "Europium", "eu" },
        { "Fluorine", "f" },    { "Iron", "fe" },       { "Gallium", "ga" },    { "Gadolinium", "gd" },
        { "Germanium", "ge" },  { "Hafnium", "hf" },    { "Mercury", "hg" },    { "Holmium", "ho" },
        { "Indium", "in" },     { "Iridium", "ir" },    { "Potassium", "k" },   { "Lanthanum", "la" },
        { "Lithium", "li" },    { "Lutetium", "lu" },   { "Magnesium", "mg" },  { "Manganese", "mn" },
        { "Molybdenum", "mo" }, { "Sodium", "na" },     { "Niobium", "nb" },    { "Neodymium", "nd" },
        { "Nickel", "ni" },     { "Osmium", "os" },     { "Phosphorus", "p" },  { "Lead", "pb" },
        { "Palladium", "pd" },  { "Praseodymium", "pr" }, { "Platinum", "pt" }, { "Rubidium", "rb" },
        { "Rhenium", "re" },    { "Rhodium", "rh" },    { "Ruthenium", "ru" },  { "Sulfur", "s" },
        { "Antimony", "sb" },   { "Scandium", "sc" },   { "Selenium", "se" },   { "Silicon", "si" },
        { "Samarium", "sm" },   { "Tin", "sn" },        { "Strontium", "sr" },  { "Tantalum", "ta" },
        { "Terbium", "tb" },    { "Tellurium", "te" },  { "Thorium", "th" },    { "Titanium", "ti" },
        { "Thallium", "tl" },   { "Thulium", "tm" },    { "Uranium", "u" },     { "Vanadium", "v" },
        { "Tungsten", "w" },    { "Yttrium", "y" },     { "Ytterbium", "yb" },  { "Zinc", "zn" },
        { "Zirconium", "zr" },
    };

    QVector<Choice> out;
    for (const auto& e : kElements) {
        const QString symbol = QString::fromLatin1(e[1]);
        QString display = symbol;
        display[0] = display[0].toUpper();
        out.append({ QStringLiteral("%1 - %2").arg(QLatin1String(e[0]), display), symbol });
    }
    return out;
}

QStringList comparisonOperators()
{
    return { QStringLiteral(">"), QStringLiteral("<"), QStringLiteral("="),
             QStringLiteral("!="), QStringLiteral(">="), QStringLiteral("<=") };
}

QString validateFilters(DatasetKind kind, const FilterParams& filters, bool fetchAll)
{
    if (fetchAll && listValue(filters, filter_keys::kStates).size() != 1) {
        return QStringLiteral("Fetching all data is supported one state at a time. "
                              "Please select exactly one state.");
    }
    if (kind == DatasetKind::Assays && filters.value(filter_keys::kElement).toString().trimmed().isEmpty()) {
        return QStringLiteral("Please select an element for the assay query.");
    }
    if (filters.contains(filter_keys::kMaxDepth)) {
        bool ok = false;
        const double depth = filters.value(filter_keys::kMaxDepth).toDouble(&ok);
        if (!ok || depth < 0.0) {
            return QStringLiteral("Maximum depth must be a non-negative number.");
        }
    }
    return QString();
}

QString defaultLayerName(DatasetKind kind, const FilterParams& filters, qint64 requestedCount)
{
    QStringList parts{ datasetKindName(kind) };

    const QStringList states = listValue(filters, filter_keys::kStates);
    if (states.size() > 3) {
        parts.append(QStringLiteral("%1States").arg(states.size()));
    } else {
        parts.append(states);
    }

    if (kind == DatasetKind::Holes) {
        const QStringList companies = listValue(filters, filter_keys::kCompanies);
        if (companies.size() > 2) {
            parts.append(QStringLiteral("%1Cos").arg(companies.size()));
        } else {
            for (const QString& c : companies) {
                parts.append(c.left(10));
            }
        }
    } else {
        const QString element = filters.value(filter_keys::kElement).toString();
        if (!element.isEmpty()) {
            parts.append(element);
        }
        const QString op = filters.value(filter_keys::kOperator).toString();
        if (!op.isEmpty()) {
            const QString value = filters.value(filter_keys::kValue).toString().trimmed();
            const QString tag = operatorTag(op);
            parts.append(value.isEmpty() ? tag : QStringLiteral("%1%2ppm").arg(tag, value));
        }
    }

    if (filters.value(filter_keys::kFetchOnlyLocation).toBool()) {
        parts.append(QStringLiteral("LocationOnly"));
    }
    if (requestedCount > 0) {
        parts.append(QStringLiteral("%1rec").arg(requestedCount));
    }

    QString name = parts.join(QLatin1Char('_'));
    if (name.size() > kMaxLayerNameLength) {
        name = name.left(kMaxLayerNameLength - 3) + QStringLiteral("...");
    }
    return name;
}

} // namespace mdi
