// src/core/SettingsStore.cpp

#include "SettingsStore.h"

#include <QSettings>

namespace mdi {

QSettingsStore::QSettingsStore()
    : m_settings(std::make_unique<QSettings>())
{
}

QSettingsStore::QSettingsStore(std::unique_ptr<QSettings> settings)
    : m_settings(std::move(settings))
{
}

QSettingsStore::~QSettingsStore()
{
    m_settings->sync();
}

QString QSettingsStore::get(const QString& key) const
{
    return m_settings->value(key).toString();
}

bool QSettingsStore::contains(const QString& key) const
{
    return m_settings->contains(key);
}

void QSettingsStore::set(const QString& key, const QString& value)
{
    m_settings->setValue(key, value);
}

void QSettingsStore::remove(const QString& key)
{
    m_settings->remove(key);
}

} // namespace mdi
