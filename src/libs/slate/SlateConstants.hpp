#pragma once

namespace Slate::Constants {

inline constexpr double kMinZoom = 0.10;
inline constexpr double kMaxZoom = 5.00;

// Wheel zoom: fraction of the current zoom applied per pixel of deltaY.
inline constexpr double kWheelZoomSensitivity = 0.002;
inline constexpr double kWheelPixelsPerStep = 100.0;
inline constexpr double kWheelAngleUnitsPerStep = 120.0;

// Two-finger tap classification.
inline constexpr int kTapMaxDurationMs = 400;
inline constexpr double kTapMaxMovePx = 15.0;
inline constexpr double kTapMaxScaleChange = 0.05;

// Returned by touchCenterAndDistance when the distance would be zero or undefined.
inline constexpr double kDegenerateTouchDistance = 1.0;

inline constexpr int kFrameIntervalMs = 16; // ~60 FPS

} // namespace Slate::Constants
