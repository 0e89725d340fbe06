// src/ui/DataTab.cpp

#include "DataTab.h"
#include "RecordTableModel.h"

#include "core/FilterCatalog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QCompleter>
#include <QDoubleValidator>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QSpinBox>
#include <QStringListModel>
#include <QTableView>
#include <QTimer>
#include <QVBoxLayout>

#include <algorithm>
#include <limits>

namespace {

constexpr int kCompanySearchDelayMs = 500;
constexpr int kDefaultRequestCount  = 100;

QListWidget* makeCheckList(QWidget* parent)
{
    auto* list = new QListWidget(parent);
    list->setMaximumHeight(90);
    list->setSelectionMode(QAbstractItemView::NoSelection);
    return list;
}

void addCheckItem(QListWidget* list, const QString& label, const QString& value)
{
    auto* item = new QListWidgetItem(label, list);
    item->setData(Qt::UserRole, value);
    item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
    item->setCheckState(Qt::Unchecked);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

DataTab::DataTab(mdi::DatasetKind kind, qint64 maxRequestCount, QWidget* parent)
    : QWidget(parent)
    , m_kind(kind)
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(6, 6, 6, 6);
    mainLayout->setSpacing(6);

    mainLayout->addWidget(createFilterGroup(maxRequestCount));
    mainLayout->addWidget(createActionRow());

    m_progressBar = new QProgressBar(this);
    m_progressBar->setTextVisible(true);
    m_progressBar->hide();
    mainLayout->addWidget(m_progressBar);

    m_summaryLabel = new QLabel(tr("No data loaded."), this);
    m_summaryLabel->setStyleSheet("QLabel { color: gray; }");
    mainLayout->addWidget(m_summaryLabel);

    m_tableModel = new RecordTableModel(this);
    m_table = new QTableView(this);
    m_table->setModel(m_tableModel);
    m_table->setAlternatingRowColors(true);
    m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_table->horizontalHeader()->setStretchLastSection(true);
    mainLayout->addWidget(m_table, 1);

    mainLayout->addWidget(createPagingRow());

    m_companyTimer = new QTimer(this);
    m_companyTimer->setSingleShot(true);
    m_companyTimer->setInterval(kCompanySearchDelayMs);
    connect(m_companyTimer, &QTimer::timeout, this, [this]() {
        emit companySearchRequested(m_companySearch->text().trimmed());
    });

    updateButtons();
}

QGroupBox* DataTab::createFilterGroup(qint64 maxRequestCount)
{
    auto* group = new QGroupBox(tr("Filters"), this);
    auto* form  = new QFormLayout(group);

    m_stateList = makeCheckList(group);
    for (const mdi::Choice& c : mdi::australianStates()) {
        addCheckItem(m_stateList, c.label, c.value);
    }
    form->addRow(tr("State(s):"), m_stateList);

    m_holeTypeList = makeCheckList(group);
    form->addRow(tr("Hole Type(s):"), m_holeTypeList);

    // Company search: type to get suggestions, pick one to add it.
    auto* companyBox = new QWidget(group);
    auto* companyLayout = new QVBoxLayout(companyBox);
    companyLayout->setContentsMargins(0, 0, 0, 0);
    m_companySearch = new QLineEdit(companyBox);
    m_companySearch->setPlaceholderText(tr("Type to search companies..."));
    m_companyModel = new QStringListModel(this);
    auto* completer = new QCompleter(m_companyModel, this);
    completer->setCaseSensitivity(Qt::CaseInsensitive);
    completer->setCompletionMode(QCompleter::UnfilteredPopupCompletion);
    m_companySearch->setCompleter(completer);
    connect(m_companySearch, &QLineEdit::textEdited, this, [this]() {
        m_companyTimer->start();
    });
    connect(completer, QOverload<const QString&>::of(&QCompleter::activated),
            this, &DataTab::addCompany);
    companyLayout->addWidget(m_companySearch);

    m_companyList = new QListWidget(companyBox);
    m_companyList->setMaximumHeight(60);
    m_companyList->setToolTip(tr("Double-click a company to remove it"));
    connect(m_companyList, &QListWidget::itemDoubleClicked, this, [this](QListWidgetItem* item) {
        delete m_companyList->takeItem(m_companyList->row(item));
    });
    companyLayout->addWidget(m_companyList);
    form->addRow(tr("Companies:"), companyBox);

    if (m_kind == mdi::DatasetKind::Holes) {
        m_maxDepthEdit = new QLineEdit(group);
        m_maxDepthEdit->setPlaceholderText(tr("Any depth"));
        auto* validator = new QDoubleValidator(0.0, 100000.0, 2, m_maxDepthEdit);
        validator->setNotation(QDoubleValidator::StandardNotation);
        m_maxDepthEdit->setValidator(validator);
        form->addRow(tr("Max Depth (m):"), m_maxDepthEdit);
    } else {
        m_elementCombo = new QComboBox(group);
        for (const mdi::Choice& c : mdi::chemicalElements()) {
            m_elementCombo->addItem(c.label, c.value);
        }
        form->addRow(tr("Element:"), m_elementCombo);

        auto* valueRow = new QWidget(group);
        auto* valueLayout = new QHBoxLayout(valueRow);
        valueLayout->setContentsMargins(0, 0, 0, 0);
        m_operatorCombo = new QComboBox(valueRow);
        m_operatorCombo->addItem(tr("None"), QString());
        for (const QString& op : mdi::comparisonOperators()) {
            m_operatorCombo->addItem(op, op);
        }
        valueLayout->addWidget(m_operatorCombo);
        m_valueEdit = new QLineEdit(valueRow);
        m_valueEdit->setPlaceholderText(tr("Value (ppm)"));
        m_valueEdit->setValidator(new QDoubleValidator(m_valueEdit));
        m_valueEdit->setEnabled(false);
        valueLayout->addWidget(m_valueEdit, 1);
        connect(m_operatorCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
            m_valueEdit->setEnabled(index > 0);
        });
        form->addRow(tr("Value:"), valueRow);
    }

    auto* countRow = new QWidget(group);
    auto* countLayout = new QHBoxLayout(countRow);
    countLayout->setContentsMargins(0, 0, 0, 0);
    m_countSpin = new QSpinBox(countRow);
    m_countSpin->setRange(1, static_cast<int>(std::min<qint64>(maxRequestCount, std::numeric_limits<int>::max())));
    m_countSpin->setValue(kDefaultRequestCount);
    m_countSpin->setGroupSeparatorShown(true);
    countLayout->addWidget(m_countSpin);
    m_fetchAllCheck = new QCheckBox(tr("Fetch all"), countRow);
    connect(m_fetchAllCheck, &QCheckBox::toggled, m_countSpin, &QSpinBox::setDisabled);
    countLayout->addWidget(m_fetchAllCheck);
    m_locationOnlyCheck = new QCheckBox(tr("Location only"), countRow);
    countLayout->addWidget(m_locationOnlyCheck);
    countLayout->addStretch(1);
    form->addRow(tr("Records:"), countRow);

    return group;
}

QWidget* DataTab::createActionRow()
{
    auto* row = new QWidget(this);
    auto* layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);

    m_fetchBtn = new QPushButton(tr("Fetch Data"), row);
    connect(m_fetchBtn, &QPushButton::clicked, this, &DataTab::submitFetch);
    layout->addWidget(m_fetchBtn);

    m_cancelBtn = new QPushButton(tr("Cancel"), row);
    connect(m_cancelBtn, &QPushButton::clicked, this, &DataTab::cancelRequested);
    layout->addWidget(m_cancelBtn);

    m_clearBtn = new QPushButton(tr("Clear"), row);
    connect(m_clearBtn, &QPushButton::clicked, this, &DataTab::clearRequested);
    layout->addWidget(m_clearBtn);

    layout->addStretch(1);

    m_importBtn = new QPushButton(tr("Import Layer..."), row);
    connect(m_importBtn, &QPushButton::clicked, this, &DataTab::importRequested);
    layout->addWidget(m_importBtn);

    return row;
}

QWidget* DataTab::createPagingRow()
{
    auto* row = new QWidget(this);
    auto* layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);

    m_prevBtn = new QPushButton(tr("< Previous"), row);
    connect(m_prevBtn, &QPushButton::clicked, this, &DataTab::previousPageRequested);
    layout->addWidget(m_prevBtn);

    m_pageLabel = new QLabel(row);
    m_pageLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(m_pageLabel, 1);

    m_nextBtn = new QPushButton(tr("Next >"), row);
    connect(m_nextBtn, &QPushButton::clicked, this, &DataTab::nextPageRequested);
    layout->addWidget(m_nextBtn);

    m_prevBtn->setEnabled(false);
    m_nextBtn->setEnabled(false);
    return row;
}

// ---------------------------------------------------------------------------
// Filters
// ---------------------------------------------------------------------------

QStringList DataTab::checkedValues(const QListWidget* list)
{
    QStringList values;
    for (int i = 0; i < list->count(); ++i) {
        const QListWidgetItem* item = list->item(i);
        if (item->checkState() == Qt::Checked) {
            values.append(item->data(Qt::UserRole).toString());
        }
    }
    return values;
}

mdi::FilterParams DataTab::currentFilters() const
{
    namespace keys = mdi::filter_keys;
    mdi::FilterParams filters;

    const QStringList states = checkedValues(m_stateList);
    if (!states.isEmpty()) {
        filters.insert(keys::kStates, states);
    }
    const QStringList holeTypes = checkedValues(m_holeTypeList);
    if (!holeTypes.isEmpty()) {
        filters.insert(keys::kHoleType, holeTypes);
    }
    QStringList companies;
    for (int i = 0; i < m_companyList->count(); ++i) {
        companies.append(m_companyList->item(i)->text());
    }
    if (!companies.isEmpty()) {
        filters.insert(keys::kCompanies, companies);
    }

    if (m_kind == mdi::DatasetKind::Holes) {
        const QString depth = m_maxDepthEdit->text().trimmed();
        if (!depth.isEmpty()) {
            filters.insert(keys::kMaxDepth, depth.toDouble());
        }
    } else {
        filters.insert(keys::kElement, m_elementCombo->currentData().toString());
        const QString op = m_operatorCombo->currentData().toString();
        if (!op.isEmpty()) {
            filters.insert(keys::kOperator, op);
            const QString value = m_valueEdit->text().trimmed();
            if (!value.isEmpty()) {
                filters.insert(keys::kValue, value);
            }
        }
    }

    if (m_fetchAllCheck->isChecked()) {
        filters.insert(keys::kFetchAll, true);
    }
    if (m_locationOnlyCheck->isChecked()) {
        filters.insert(keys::kFetchOnlyLocation, true);
    }
    return filters;
}

qint64 DataTab::requestedCount() const
{
    return m_fetchAllCheck->isChecked() ? 0 : m_countSpin->value();
}

void DataTab::submitFetch()
{
    const mdi::FilterParams filters = currentFilters();
    const QString problem = mdi::validateFilters(m_kind, filters, m_fetchAllCheck->isChecked());
    if (!problem.isEmpty()) {
        QMessageBox::warning(this, tr("Invalid Filters"), problem);
        return;
    }
    emit fetchRequested(filters, requestedCount());
}

void DataTab::addCompany(const QString& name)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty() || !m_companyList->findItems(trimmed, Qt::MatchExactly).isEmpty()) {
        return;
    }
    m_companyList->addItem(trimmed);
    // Clear once the completer has finished with the line edit.
    QTimer::singleShot(0, m_companySearch, &QLineEdit::clear);
}

void DataTab::setHoleTypes(const QStringList& holeTypes)
{
    const QStringList checked = checkedValues(m_holeTypeList);
    m_holeTypeList->clear();
    for (const QString& t : holeTypes) {
        addCheckItem(m_holeTypeList, t, t);
        if (checked.contains(t)) {
            m_holeTypeList->item(m_holeTypeList->count() - 1)->setCheckState(Qt::Checked);
        }
    }
}

void DataTab::setCompanySuggestions(const QString& query, const QStringList& names)
{
    // Stale answer for text the user has since changed.
    if (query.trimmed() != m_companySearch->text().trimmed()) {
        return;
    }
    m_companyModel->setStringList(names);
    if (!names.isEmpty() && m_companySearch->hasFocus()) {
        m_companySearch->completer()->complete();
    }
}

void DataTab::resetFilters()
{
    for (QListWidget* list : { m_stateList, m_holeTypeList }) {
        for (int i = 0; i < list->count(); ++i) {
            list->item(i)->setCheckState(Qt::Unchecked);
        }
    }
    m_companySearch->clear();
    m_companyList->clear();
    m_companyModel->setStringList({});
    if (m_maxDepthEdit) {
        m_maxDepthEdit->clear();
    }
    if (m_elementCombo) {
        m_elementCombo->setCurrentIndex(0);
        m_operatorCombo->setCurrentIndex(0);
        m_valueEdit->clear();
    }
    m_countSpin->setValue(kDefaultRequestCount);
    m_fetchAllCheck->setChecked(false);
    m_locationOnlyCheck->setChecked(false);
}

// ---------------------------------------------------------------------------
// State display
// ---------------------------------------------------------------------------

void DataTab::showDataset(const mdi::DatasetState& state,
                          const mdi::PaginationInfo& info,
                          const mdi::RecordList& pageRecords)
{
    m_hasData = info.hasData;
    m_tableModel->setPage(state.headers, state.displayHeaders, pageRecords);

    if (!info.hasData) {
        m_summaryLabel->setText(state.fetchDetails.isEmpty() ? tr("No data loaded.")
                                                             : tr("No records matched the filters."));
        m_pageLabel->clear();
        m_prevBtn->setEnabled(false);
        m_nextBtn->setEnabled(false);
        updateButtons();
        return;
    }

    QString summary = tr("%L1 records fetched").arg(info.totalRecords);
    if (state.totalRecords > info.totalRecords) {
        summary += tr(" of %L1 available").arg(state.totalRecords);
    }
    if (!state.fetchDetails.isEmpty()) {
        summary += tr(" in %1 page(s), %2 s").arg(state.fetchDetails.pageCount)
                       .arg(state.fetchDetails.elapsedSeconds, 0, 'f', 1);
    }
    if (info.displayCount < info.totalRecords) {
        summary += tr(". Showing the first %L1; import to get all.").arg(info.displayCount);
    }
    m_summaryLabel->setText(summary);

    m_pageLabel->setText(tr("Page %1 of %2 (%3 rows)")
                             .arg(info.currentPage)
                             .arg(info.totalPages)
                             .arg(info.showingRecords));
    m_prevBtn->setEnabled(info.currentPage > 1);
    m_nextBtn->setEnabled(info.currentPage < info.totalPages);
    updateButtons();
}

void DataTab::setAuthenticated(bool authenticated)
{
    m_authenticated = authenticated;
    updateButtons();
}

void DataTab::setFetching(bool fetching)
{
    m_fetching = fetching;
    if (fetching) {
        m_progressBar->setRange(0, 0);
        m_progressBar->setFormat(tr("Fetching..."));
        m_progressBar->show();
    } else {
        m_progressBar->hide();
    }
    updateButtons();
}

void DataTab::setImporting(bool importing)
{
    m_importing = importing;
    if (importing) {
        m_progressBar->setRange(0, 0);
        m_progressBar->setFormat(tr("Importing..."));
        m_progressBar->show();
    } else {
        m_progressBar->hide();
    }
    updateButtons();
}

void DataTab::setProgress(qint64 fetched, qint64 total)
{
    const int max = static_cast<int>(std::min<qint64>(std::max<qint64>(total, 1), std::numeric_limits<int>::max()));
    m_progressBar->setRange(0, max);
    m_progressBar->setValue(static_cast<int>(std::min<qint64>(fetched, max)));
    m_progressBar->setFormat(tr("%L1 / %L2 records").arg(fetched).arg(total));
}

void DataTab::setProgressText(const QString& text)
{
    m_progressBar->setFormat(text);
}

void DataTab::updateButtons()
{
    const bool busy = m_fetching || m_importing;
    m_fetchBtn->setEnabled(m_authenticated && !busy);
    m_cancelBtn->setEnabled(busy);
    m_clearBtn->setEnabled(m_hasData && !busy);
    m_importBtn->setEnabled(m_hasData && !busy);
}
