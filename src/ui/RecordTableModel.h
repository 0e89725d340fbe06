// src/ui/RecordTableModel.h
//
// RecordTableModel – read-only table over one page of records.

#pragma once

#include "core/Types.h"

#include <QAbstractTableModel>

class RecordTableModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    explicit RecordTableModel(QObject* parent = nullptr);

    /// `headers` are the record field names; `titles` the column captions.
    void setPage(const QStringList& headers, const QStringList& titles, const mdi::RecordList& records);
    void clear();

    int      rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int      columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

private:
    QStringList      m_headers;
    QStringList      m_titles;
    mdi::RecordList  m_records;
};
