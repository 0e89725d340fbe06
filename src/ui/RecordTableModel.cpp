// src/ui/RecordTableModel.cpp

#include "RecordTableModel.h"

RecordTableModel::RecordTableModel(QObject* parent)
    : QAbstractTableModel(parent)
{
}

void RecordTableModel::setPage(const QStringList& headers, const QStringList& titles, const mdi::RecordList& records)
{
    beginResetModel();
    m_headers = headers;
    m_titles  = titles;
    m_records = records;
    endResetModel();
}

void RecordTableModel::clear()
{
    setPage({}, {}, {});
}

int RecordTableModel::rowCount(const QModelIndex& parent) const
{
    return parent.isValid() ? 0 : static_cast<int>(m_records.size());
}

int RecordTableModel::columnCount(const QModelIndex& parent) const
{
    return parent.isValid() ? 0 : static_cast<int>(m_headers.size());
}

QVariant RecordTableModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() >= m_records.size() || index.column() >= m_headers.size()) {
        return {};
    }
    if (role != Qt::DisplayRole && role != Qt::ToolTipRole) {
        return {};
    }
    const QVariant v = m_records.at(index.row()).value(m_headers.at(index.column()));
    if (v.isNull()) {
        return QString();
    }
    return v.toString();
}

QVariant RecordTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole) {
        return {};
    }
    if (orientation == Qt::Vertical) {
        return section + 1;
    }
    if (section < m_titles.size()) {
        return m_titles.at(section);
    }
    return section < m_headers.size() ? QVariant(m_headers.at(section)) : QVariant();
}
