// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "slate/SlateGlobal.hpp"
#include "slate/SlateTypes.hpp"
#include "slate/gestures/TouchGesture.hpp"

#include <QtCore/QString>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <optional>
#include <utility>

using namespace Qt::StringLiterals;

namespace Slate::Config {

struct SettingsConfig final {
    QString organizationName;
    QString applicationName;

    // When set, settings are read from this INI file instead of the per-user location.
    QString filePathOverride;
};

// Gesture preferences, already validated.
struct SLATE_EXPORT GestureSettings final {
    ZoomLimits zoomLimits;
    double wheelZoomSensitivity = Constants::kWheelZoomSensitivity;
    Qt::MouseButton panButton = Qt::RightButton;
    Gestures::TouchThresholds touch;
    int frameIntervalMs = Constants::kFrameIntervalMs;
};

namespace Keys {
inline constexpr QStringView MinZoom = u"viewport/minZoom";
inline constexpr QStringView MaxZoom = u"viewport/maxZoom";
inline constexpr QStringView WheelZoomSensitivity = u"wheel/zoomSensitivity";
inline constexpr QStringView DragPanButton = u"dragPan/button";
inline constexpr QStringView TapMaxDurationMs = u"touch/tapMaxDurationMs";
inline constexpr QStringView TapMaxMovePx = u"touch/tapMaxMovePx";
inline constexpr QStringView TapMaxScaleChange = u"touch/tapMaxScaleChange";
inline constexpr QStringView FrameIntervalMs = u"frame/intervalMs";
} // namespace Keys

///
// Value validation. Each reader returns \a def for a missing value and logs a
// warning before returning \a def for a malformed or out-of-range one.

SLATE_EXPORT double readBoundedDouble(QStringView key, const QVariant& raw, double def, double lo, double hi);
SLATE_EXPORT int readBoundedInt(QStringView key, const QVariant& raw, int def, int lo, int hi);
SLATE_EXPORT Qt::MouseButton readPanButton(QStringView key, const QVariant& raw, Qt::MouseButton def);

SLATE_EXPORT std::optional<Qt::MouseButton> panButtonFromName(QStringView name);
SLATE_EXPORT QString panButtonName(Qt::MouseButton button);

// Swaps a reversed zoom range.
SLATE_EXPORT ZoomLimits normalizedZoomLimits(ZoomLimits limits);

template <typename PersistencePolicy>
class BasicSettings final {
public:
    using Policy = PersistencePolicy;
    using SettingsHandle = typename Policy::SettingsHandle;

    explicit BasicSettings(SettingsConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
    {}

    const SettingsConfig& config() const noexcept { return m_config; }
    const Policy& policy() const noexcept { return m_policy; }

    QVariant value(QStringView key, const QVariant& def = {}) const
    {
        auto h = m_policy.openSettings(m_config);
        return m_policy.settingsValue(h, key, def);
    }

    void setValue(QStringView key, const QVariant& value)
    {
        auto h = m_policy.openSettings(m_config);
        m_policy.setSettingsValue(h, key, value);
        m_policy.syncSettings(h);
    }

    void remove(QStringView key)
    {
        auto h = m_policy.openSettings(m_config);
        m_policy.removeSettingsKey(h, key);
        m_policy.syncSettings(h);
    }

    bool contains(QStringView key) const
    {
        auto h = m_policy.openSettings(m_config);
        return m_policy.settingsContains(h, key);
    }

    GestureSettings gestureSettings() const
    {
        auto h = m_policy.openSettings(m_config);
        auto read = [&](QStringView key) -> QVariant {
            return m_policy.settingsContains(h, key) ? m_policy.settingsValue(h, key, {}) : QVariant{};
        };

        const GestureSettings defaults;
        GestureSettings out;

        ZoomLimits limits;
        limits.minZoom = readBoundedDouble(Keys::MinZoom, read(Keys::MinZoom), defaults.zoomLimits.minZoom, 0.001, 100.0);
        limits.maxZoom = readBoundedDouble(Keys::MaxZoom, read(Keys::MaxZoom), defaults.zoomLimits.maxZoom, 0.001, 100.0);
        out.zoomLimits = normalizedZoomLimits(limits);

        out.wheelZoomSensitivity = readBoundedDouble(Keys::WheelZoomSensitivity,
                                                     read(Keys::WheelZoomSensitivity),
                                                     defaults.wheelZoomSensitivity, 1e-6, 1.0);
        out.panButton = readPanButton(Keys::DragPanButton, read(Keys::DragPanButton), defaults.panButton);

        out.touch.tapMaxDurationMs = readBoundedInt(Keys::TapMaxDurationMs, read(Keys::TapMaxDurationMs),
                                                    static_cast<int>(defaults.touch.tapMaxDurationMs), 1, 10000);
        out.touch.tapMaxMovePx = readBoundedDouble(Keys::TapMaxMovePx, read(Keys::TapMaxMovePx),
                                                   defaults.touch.tapMaxMovePx, 0.0, 1000.0);
        out.touch.tapMaxScaleChange = readBoundedDouble(Keys::TapMaxScaleChange, read(Keys::TapMaxScaleChange),
                                                        defaults.touch.tapMaxScaleChange, 0.0, 10.0);

        out.frameIntervalMs = readBoundedInt(Keys::FrameIntervalMs, read(Keys::FrameIntervalMs),
                                             defaults.frameIntervalMs, 1, 1000);
        return out;
    }

    void setGestureSettings(const GestureSettings& s)
    {
        auto h = m_policy.openSettings(m_config);
        m_policy.setSettingsValue(h, Keys::MinZoom, s.zoomLimits.minZoom);
        m_policy.setSettingsValue(h, Keys::MaxZoom, s.zoomLimits.maxZoom);
        m_policy.setSettingsValue(h, Keys::WheelZoomSensitivity, s.wheelZoomSensitivity);
        m_policy.setSettingsValue(h, Keys::DragPanButton, panButtonName(s.panButton));
        m_policy.setSettingsValue(h, Keys::TapMaxDurationMs, static_cast<int>(s.touch.tapMaxDurationMs));
        m_policy.setSettingsValue(h, Keys::TapMaxMovePx, s.touch.tapMaxMovePx);
        m_policy.setSettingsValue(h, Keys::TapMaxScaleChange, s.touch.tapMaxScaleChange);
        m_policy.setSettingsValue(h, Keys::FrameIntervalMs, s.frameIntervalMs);
        m_policy.syncSettings(h);
    }

private:
    SettingsConfig m_config;
    Policy m_policy;
};

} // namespace Slate::Config
