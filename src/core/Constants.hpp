#pragma once

#include <array>
#include <raylib.h>

namespace gravsim::constants {
inline constexpr int window_width = 640;
inline constexpr int window_height = 480;
inline constexpr int target_fps = 120;

inline constexpr ::Color background{0, 0, 0, 255};

// Bodies are colored by index; indices past the palette get a derived color.
inline constexpr std::array<::Color, 4> body_palette{{
    {255, 0, 0, 255},
    {0, 255, 0, 255},
    {0, 0, 255, 255},
    {255, 255, 0, 255},
}};
inline constexpr int derived_color_min = 64;
inline constexpr int derived_color_span = 192;

// Vertical extent of the view in world units; the origin sits at the window center.
inline constexpr double view_height_units = 3.0;
inline constexpr float zoom_wheel_scale = 0.1F;
inline constexpr float min_zoom_factor = 0.05F;
inline constexpr float max_zoom_factor = 20.0F;

// Pixel radius of a body: (a*m + b) / (m + c). Grows with mass and saturates at a px.
inline constexpr double radius_mass_slope = 16.0;
inline constexpr double radius_offset = 80.0;
inline constexpr double radius_mass_bias = 20.0;

inline constexpr int trail_alpha_min = 20;
inline constexpr int trail_alpha_max = 250;
inline constexpr float trail_alpha_range = 230.0F;
inline constexpr int trail_length_max = 2000;

// Physics defaults (dimensionless units: unit masses, unit distances)
inline constexpr double default_g = 0.8;
inline constexpr float g_min = 0.0F;
inline constexpr float g_max = 2.0F;
inline constexpr double default_orbit_radius = 1.0;

// Frame dt above this is clamped by the driver before stepping.
inline constexpr float max_frame_dt = 0.03F;
inline constexpr float max_frame_dt_min = 0.001F;
inline constexpr float max_frame_dt_max = 0.1F;

inline constexpr int default_trail_max = 200;  // points
inline constexpr unsigned char alpha_opaque = 255;

// Chenciner-Montgomery figure-eight initial conditions for G = 1, m = 1.
inline constexpr double figure8_x = 0.97000436;
inline constexpr double figure8_y = -0.24308753;
inline constexpr double figure8_vx = -0.93240737;
inline constexpr double figure8_vy = -0.86473146;
}  // namespace gravsim::constants
