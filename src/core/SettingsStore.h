// src/core/SettingsStore.h
//
// Persisted key/value capability handed to the SessionController at
// construction.  Only the four token keys below are ever written.

#pragma once

#include <QString>
#include <QStringList>

#include <memory>

class QSettings;

namespace mdi {

namespace settings_keys {
inline const QString kAccessToken  = QStringLiteral("auth/accessToken");
inline const QString kRefreshToken = QStringLiteral("auth/refreshToken");
inline const QString kExpiresAt    = QStringLiteral("auth/expiresAt");
inline const QString kLastIdentity = QStringLiteral("auth/lastIdentity");

inline QStringList all()
{
    return { kAccessToken, kRefreshToken, kExpiresAt, kLastIdentity };
}
} // namespace settings_keys

class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    /// Empty string when the key is absent.
    [[nodiscard]] virtual QString get(const QString& key) const = 0;
    [[nodiscard]] virtual bool    contains(const QString& key) const = 0;
    virtual void set(const QString& key, const QString& value) = 0;
    virtual void remove(const QString& key) = 0;
};

/// QSettings-backed store under the application's organisation scope.
class QSettingsStore final : public SettingsStore {
public:
    QSettingsStore();
    explicit QSettingsStore(std::unique_ptr<QSettings> settings);
    ~QSettingsStore() override;

    QSettingsStore(const QSettingsStore&)            = delete;
    QSettingsStore& operator=(const QSettingsStore&) = delete;

    [[nodiscard]] QString get(const QString& key) const override;
    [[nodiscard]] bool    contains(const QString& key) const override;
    void set(const QString& key, const QString& value) override;
    void remove(const QString& key) override;

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace mdi
