#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace gravsim {

// Time-stepping schemes, in the order the viewer lists them.
enum class Integrator : std::uint8_t {
    Euler = 0,
    ModifiedEuler = 1,
    SemiImplicitEuler = 2,
    RungeKutta4 = 3,
};

inline constexpr std::array<Integrator, 4> all_integrators{Integrator::Euler, Integrator::ModifiedEuler,
                                                           Integrator::SemiImplicitEuler, Integrator::RungeKutta4};

inline constexpr Integrator default_integrator = Integrator::SemiImplicitEuler;

// Short display name ("Euler", "Mod. Euler", "SI Euler", "Runge-Kutta").
std::string_view integrator_name(Integrator integrator);

// Throws UnsupportedStrategy for anything outside the enum.
Integrator integrator_from_index(int index);
Integrator integrator_from_name(std::string_view name);

// Local truncation order of the scheme (1 for both Euler variants).
int integrator_order(Integrator integrator);

}  // namespace gravsim
