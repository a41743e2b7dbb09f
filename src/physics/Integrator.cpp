#include "Integrator.hpp"

#include <string>

#include "../core/Errors.hpp"

namespace gravsim {

std::string_view integrator_name(const Integrator integrator) {
    switch (integrator) {
        case Integrator::Euler: return "Euler";
        case Integrator::ModifiedEuler: return "Mod. Euler";
        case Integrator::SemiImplicitEuler: return "SI Euler";
        case Integrator::RungeKutta4: return "Runge-Kutta";
    }
    throw UnsupportedStrategy("#" + std::to_string(static_cast<int>(integrator)));
}

Integrator integrator_from_index(const int index) {
    for (const Integrator candidate : all_integrators) {
        if (static_cast<int>(candidate) == index) return candidate;
    }
    throw UnsupportedStrategy("#" + std::to_string(index));
}

Integrator integrator_from_name(const std::string_view name) {
    for (const Integrator candidate : all_integrators) {
        if (integrator_name(candidate) == name) return candidate;
    }
    throw UnsupportedStrategy(std::string(name));
}

int integrator_order(const Integrator integrator) {
    switch (integrator) {
        case Integrator::Euler:
        case Integrator::SemiImplicitEuler: return 1;
        case Integrator::ModifiedEuler: return 2;
        case Integrator::RungeKutta4: return 4;
    }
    throw UnsupportedStrategy("#" + std::to_string(static_cast<int>(integrator)));
}

}  // namespace gravsim
