// src/ui/DataTab.h
//
// DataTab – one tab per dataset kind: filter form, fetch/import controls,
// progress, and a paged table over the display prefix.

#pragma once

#include "core/DatasetStore.h"
#include "core/Types.h"

#include <QWidget>

class QCheckBox;
class QComboBox;
class QGroupBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QStringListModel;
class QTableView;
class QTimer;
class RecordTableModel;

/// \brief Filter + table page for Holes or Assays.
class DataTab : public QWidget
{
    Q_OBJECT

public:
    DataTab(mdi::DatasetKind kind, qint64 maxRequestCount, QWidget* parent = nullptr);

    mdi::DatasetKind kind() const { return m_kind; }

    /// Filters as the data endpoint expects them.
    mdi::FilterParams currentFilters() const;

    /// 0 when "fetch all" is checked.
    qint64 requestedCount() const;

    void setHoleTypes(const QStringList& holeTypes);
    void setCompanySuggestions(const QString& query, const QStringList& names);

    void showDataset(const mdi::DatasetState& state,
                     const mdi::PaginationInfo& info,
                     const mdi::RecordList& pageRecords);

    void setAuthenticated(bool authenticated);
    void setFetching(bool fetching);
    void setImporting(bool importing);
    void setProgress(qint64 fetched, qint64 total);
    void setProgressText(const QString& text);

    /// Restore every filter control to its default.
    void resetFilters();

signals:
    void fetchRequested(const mdi::FilterParams& filters, qint64 requestedCount);
    void cancelRequested();
    void clearRequested();
    void importRequested();
    void previousPageRequested();
    void nextPageRequested();
    void companySearchRequested(const QString& query);

private:
    QGroupBox* createFilterGroup(qint64 maxRequestCount);
    QWidget*   createActionRow();
    QWidget*   createPagingRow();
    void       submitFetch();
    void       addCompany(const QString& name);
    void       updateButtons();

    static QStringList checkedValues(const QListWidget* list);

    mdi::DatasetKind m_kind;
    bool m_authenticated = false;
    bool m_fetching      = false;
    bool m_importing     = false;
    bool m_hasData       = false;

    // Filters
    QListWidget*      m_stateList        = nullptr;
    QListWidget*      m_holeTypeList     = nullptr;
    QLineEdit*        m_companySearch    = nullptr;
    QStringListModel* m_companyModel     = nullptr;
    QListWidget*      m_companyList      = nullptr;
    QTimer*           m_companyTimer     = nullptr;
    QLineEdit*        m_maxDepthEdit     = nullptr;   // Holes only
    QComboBox*        m_elementCombo     = nullptr;   // Assays only
    QComboBox*        m_operatorCombo    = nullptr;   // Assays only
    QLineEdit*        m_valueEdit        = nullptr;   // Assays only
    QSpinBox*         m_countSpin        = nullptr;
    QCheckBox*        m_fetchAllCheck    = nullptr;
    QCheckBox*        m_locationOnlyCheck = nullptr;

    // Actions
    QPushButton*  m_fetchBtn    = nullptr;
    QPushButton*  m_cancelBtn   = nullptr;
    QPushButton*  m_clearBtn    = nullptr;
    QPushButton*  m_importBtn   = nullptr;
    QProgressBar* m_progressBar = nullptr;
    QLabel*       m_summaryLabel = nullptr;

    // Table
    QTableView*       m_table      = nullptr;
    RecordTableModel* m_tableModel = nullptr;
    QPushButton*      m_prevBtn    = nullptr;
    QPushButton*      m_nextBtn    = nullptr;
    QLabel*           m_pageLabel  = nullptr;
};
