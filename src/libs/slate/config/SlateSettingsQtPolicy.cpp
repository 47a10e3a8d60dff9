// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "slate/config/SlateSettingsQtPolicy.hpp"

namespace Slate::Config {

QtSettingsPolicy::SettingsHandle QtSettingsPolicy::openSettings(const SettingsConfig& config) const
{
    auto h = SettingsHandle{};
    if (!config.filePathOverride.isEmpty()) {
        h.settings = std::make_unique<QSettings>(config.filePathOverride, QSettings::IniFormat);
    } else {
        const QString org = config.organizationName.isEmpty() ? QStringLiteral("Slate") : config.organizationName;
        const QString app = config.applicationName.isEmpty() ? QStringLiteral("Slate") : config.applicationName;
        h.settings = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope, org, app);
    }
    h.settings->setFallbacksEnabled(false);

    if (h.settings->status() != QSettings::NoError)
        qCWarning(slatesettingslog) << "Settings file is unreadable:" << h.settings->fileName();
    return h;
}

QVariant QtSettingsPolicy::settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
{
    return h.settings ? h.settings->value(key.toString(), def) : def;
}

void QtSettingsPolicy::setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
{
    if (!h.settings) return;
    h.settings->setValue(key.toString(), value);
}

void QtSettingsPolicy::removeSettingsKey(SettingsHandle& h, QStringView key) const
{
    if (!h.settings) return;
    h.settings->remove(key.toString());
}

bool QtSettingsPolicy::settingsContains(const SettingsHandle& h, QStringView key) const
{
    return h.settings ? h.settings->contains(key.toString()) : false;
}

void QtSettingsPolicy::syncSettings(SettingsHandle& h) const
{
    if (!h.settings) return;
    h.settings->sync();
}

} // namespace Slate::Config
