#pragma once

#include "slate/config/SlateSettings.hpp"

#include <QtCore/QSettings>

#include <memory>

namespace Slate::Config {

class SLATE_EXPORT QtSettingsPolicy final {
public:
	struct SettingsHandle final {
		std::unique_ptr<QSettings> settings;
	};

	SettingsHandle openSettings(const SettingsConfig& config) const;
	QVariant settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const;
	void setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const;
	void removeSettingsKey(SettingsHandle& h, QStringView key) const;
	bool settingsContains(const SettingsHandle& h, QStringView key) const;
	void syncSettings(SettingsHandle& h) const;
};

using Settings = BasicSettings<QtSettingsPolicy>;

} // namespace Slate::Config
