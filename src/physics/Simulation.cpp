#include "Simulation.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <raylib.h>
#include <string>
#include <utility>

#include "../core/Errors.hpp"

namespace gravsim {

namespace {

void validate_body(const char* operation, const double mass, const DVec3& position, const DVec3& velocity) {
    if (!(std::isfinite(mass) && mass > 0.0)) {
        throw InvalidArgument(std::string(operation) + ": mass must be finite and positive, got " +
                              std::to_string(mass));
    }
    if (!is_finite(position) || !is_finite(velocity)) {
        throw InvalidArgument(std::string(operation) + ": position and velocity must be finite");
    }
}

void validate_dt(const char* operation, const double dt) {
    if (!std::isfinite(dt) || dt < 0.0) {
        throw InvalidArgument(std::string(operation) + ": dt must be finite and non-negative, got " +
                              std::to_string(dt));
    }
}

// Sum over j != index in ascending order; position_of(j) supplies body j's position.
template <typename PositionOf>
DVec3 sum_acceleration(const std::vector<Body>& bodies, const double g, const std::size_t index, const DVec3& position,
                       PositionOf position_of) {
    DVec3 acc{};
    for (std::size_t j = 0; j < bodies.size(); ++j) {
        if (j == index) continue;
        const DVec3 offset = position_of(j) - position;
        const double r2 = length2(offset);
        if (r2 == 0.0) throw SingularConfiguration("zero separation during force evaluation", index, j);
        const double r = std::sqrt(r2);
        const DVec3 contribution = g * bodies[j].mass * offset / (r2 * r);
        if (!is_finite(contribution)) throw SingularConfiguration("gravitational force overflowed", index, j);
        acc += contribution;
    }
    return acc;
}

// Pair with the smallest separation; used to attribute an overflowed step.
std::pair<std::size_t, std::size_t> closest_pair(const std::vector<BodyState>& states) {
    std::pair<std::size_t, std::size_t> best{0, 0};
    double bestR2 = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < states.size(); ++i) {
        for (std::size_t j = i + 1; j < states.size(); ++j) {
            const double r2 = length2(states[j].position - states[i].position);
            if (r2 < bestR2) {
                bestR2 = r2;
                best = {i, j};
            }
        }
    }
    return best;
}

std::vector<BodyState> advance(const std::vector<BodyState>& base, const std::vector<Derivative>& k, const double h) {
    std::vector<BodyState> out(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        out[i].position = base[i].position + k[i].velocity * h;
        out[i].velocity = base[i].velocity + k[i].acceleration * h;
    }
    return out;
}

}  // namespace

Simulation::Simulation(const double g) { set_gravitational_constant(g); }

void Simulation::add_body(const double mass, const DVec3& position, const DVec3& velocity) {
    validate_body("add_body", mass, position, velocity);
    bodies_.push_back(Body{mass, BodyState{position, velocity}});
    TraceLog(LOG_DEBUG, "gravsim: added body %zu (m=%g)", bodies_.size() - 1, mass);
}

void Simulation::set_body(const std::size_t index, const double mass, const DVec3& position, const DVec3& velocity) {
    check_index("set_body", index);
    validate_body("set_body", mass, position, velocity);
    bodies_[index] = Body{mass, BodyState{position, velocity}};
    TraceLog(LOG_DEBUG, "gravsim: replaced body %zu (m=%g)", index, mass);
}

void Simulation::remove_body(const std::size_t index) {
    check_index("remove_body", index);
    bodies_.erase(bodies_.begin() + static_cast<std::ptrdiff_t>(index));
    TraceLog(LOG_DEBUG, "gravsim: removed body %zu, %zu left", index, bodies_.size());
}

void Simulation::clear() {
    bodies_.clear();
    time_ = 0.0;
}

const Body& Simulation::body(const std::size_t index) const {
    check_index("body", index);
    return bodies_[index];
}

void Simulation::set_gravitational_constant(const double g) {
    if (!std::isfinite(g) || g < 0.0) {
        throw InvalidArgument("set_gravitational_constant: G must be finite and non-negative, got " +
                              std::to_string(g));
    }
    g_ = g;
    TraceLog(LOG_DEBUG, "gravsim: G = %.4f", g_);
}

void Simulation::set_integrator(const Integrator integrator) {
    // Rejects values cast from out-of-range integers.
    static_cast<void>(integrator_name(integrator));
    integrator_ = integrator;
}

DVec3 Simulation::compute_acceleration(const std::size_t index, const BodyState& state) const {
    check_index("compute_acceleration", index);
    return acceleration_at(index, state.position);
}

DVec3 Simulation::compute_acceleration(const std::size_t index) const {
    check_index("compute_acceleration", index);
    return acceleration_at(index, bodies_[index].state.position);
}

Derivative Simulation::derivative(const std::size_t index, const BodyState& state) const {
    return Derivative{state.velocity, compute_acceleration(index, state)};
}

void Simulation::step(const double dt) {
    switch (integrator_) {
        case Integrator::Euler: step_euler(dt); return;
        case Integrator::ModifiedEuler: step_modified_euler(dt); return;
        case Integrator::SemiImplicitEuler: step_semi_implicit_euler(dt); return;
        case Integrator::RungeKutta4: step_runge_kutta(dt); return;
    }
    throw UnsupportedStrategy("#" + std::to_string(static_cast<int>(integrator_)));
}

void Simulation::step_euler(const double dt) {
    validate_dt("step_euler", dt);
    const Configuration current = snapshot();
    commit(advance(current, stage(current, dt), dt), dt);
}

void Simulation::step_semi_implicit_euler(const double dt) {
    validate_dt("step_semi_implicit_euler", dt);
    const Configuration current = snapshot();
    const std::vector<Derivative> k = stage(current, dt);

    Configuration next(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        DVec3 position = current[i].position + k[i].velocity * dt;
        const DVec3 velocity = current[i].velocity + k[i].acceleration * dt;
        // Same as stepping the position with the updated velocity.
        position += k[i].acceleration * dt * dt;
        // Deliberate precision loss: the state is stored at float resolution.
        next[i] = BodyState{round_trip_single(position), round_trip_single(velocity)};
    }
    commit(std::move(next), dt);
}

void Simulation::step_modified_euler(const double dt) {
    validate_dt("step_modified_euler", dt);
    const Configuration current = snapshot();
    const std::vector<Derivative> k1 = stage(current, dt);
    const std::vector<Derivative> k2 = stage(advance(current, k1, dt), dt);

    Configuration next(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        next[i].position = current[i].position + (k1[i].velocity + k2[i].velocity) * (dt / 2.0);
        next[i].velocity = current[i].velocity + (k1[i].acceleration + k2[i].acceleration) * (dt / 2.0);
    }
    commit(std::move(next), dt);
}

void Simulation::step_runge_kutta(const double dt) {
    validate_dt("step_runge_kutta", dt);
    const Configuration current = snapshot();
    const std::vector<Derivative> k1 = stage(current, dt);
    const std::vector<Derivative> k2 = stage(advance(current, k1, dt / 2.0), dt);
    const std::vector<Derivative> k3 = stage(advance(current, k2, dt / 2.0), dt);
    const std::vector<Derivative> k4 = stage(advance(current, k3, dt), dt);

    Configuration next(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        next[i].position = current[i].position + (k1[i].velocity + 2.0 * k2[i].velocity + 2.0 * k3[i].velocity +
                                                  k4[i].velocity) * (dt / 6.0);
        next[i].velocity = current[i].velocity + (k1[i].acceleration + 2.0 * k2[i].acceleration +
                                                  2.0 * k3[i].acceleration + k4[i].acceleration) * (dt / 6.0);
    }
    commit(std::move(next), dt);
}

double Simulation::kinetic_energy() const {
    double KE = 0.0;
    for (const Body& b : bodies_) KE += b.mass * length2(b.state.velocity) / 2.0;
    return KE;
}

double Simulation::potential_energy() const {
    double PE = 0.0;
    const std::size_t n = bodies_.size();
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            const double r = length(bodies_[j].state.position - bodies_[i].state.position);
            if (r == 0.0) throw SingularConfiguration("potential_energy: coincident bodies", i, j);
            PE -= g_ * bodies_[i].mass * bodies_[j].mass / r;
        }
    }
    return PE;
}

double Simulation::total_energy() const { return kinetic_energy() + potential_energy(); }

DVec3 Simulation::center_of_mass() const {
    if (bodies_.empty()) throw EmptySystem("center_of_mass");
    DVec3 weighted{};
    double M = 0.0;
    for (const Body& b : bodies_) {
        weighted += b.mass * b.state.position;
        M += b.mass;
    }
    if (!(M > 0.0)) throw EmptySystem("center_of_mass");
    return weighted / M;
}

DVec3 Simulation::linear_momentum() const {
    DVec3 P{};
    for (const Body& b : bodies_) P += b.mass * b.state.velocity;
    return P;
}

double Simulation::angular_momentum(const ReferenceFrame& frame) const { return angular_momentum_vector(frame).z; }

DVec3 Simulation::angular_momentum_vector(const ReferenceFrame& frame) const {
    DVec3 L{};
    for (const Body& b : bodies_) {
        L += b.mass * cross(b.state.position - frame.position, b.state.velocity - frame.velocity);
    }
    return L;
}

DVec3 Simulation::net_force() const {
    DVec3 F{};
    for (std::size_t i = 0; i < bodies_.size(); ++i) {
        F += bodies_[i].mass * acceleration_at(i, bodies_[i].state.position);
    }
    return F;
}

AxisSeries Simulation::positions_by_axis() const {
    AxisSeries out;
    out.x.reserve(bodies_.size());
    out.y.reserve(bodies_.size());
    out.z.reserve(bodies_.size());
    for (const Body& b : bodies_) {
        out.x.push_back(b.state.position.x);
        out.y.push_back(b.state.position.y);
        out.z.push_back(b.state.position.z);
    }
    return out;
}

void Simulation::zero_net_momentum() {
    if (bodies_.empty()) throw EmptySystem("zero_net_momentum");
    double M = 0.0;
    for (const Body& b : bodies_) M += b.mass;
    const DVec3 v0 = linear_momentum() / M;
    for (Body& b : bodies_) b.state.velocity -= v0;
}

Simulation::Configuration Simulation::snapshot() const {
    Configuration out;
    out.reserve(bodies_.size());
    for (const Body& b : bodies_) out.push_back(b.state);
    return out;
}

DVec3 Simulation::acceleration_in(const Configuration& configuration, const std::size_t index,
                                  const DVec3& position) const {
    return sum_acceleration(bodies_, g_, index, position,
                            [&configuration](const std::size_t j) -> const DVec3& { return configuration[j].position; });
}

DVec3 Simulation::acceleration_at(const std::size_t index, const DVec3& position) const {
    return sum_acceleration(bodies_, g_, index, position,
                            [this](const std::size_t j) -> const DVec3& { return bodies_[j].state.position; });
}

std::vector<Derivative> Simulation::derivatives_in(const Configuration& configuration) const {
    std::vector<Derivative> out(configuration.size());
    for (std::size_t i = 0; i < configuration.size(); ++i) {
        out[i] = Derivative{configuration[i].velocity, acceleration_in(configuration, i, configuration[i].position)};
    }
    return out;
}

std::vector<Derivative> Simulation::stage(const Configuration& configuration, const double dt) const {
    try {
        return derivatives_in(configuration);
    } catch (const SingularConfiguration& e) {
        TraceLog(LOG_WARNING, "gravsim: step of dt=%g rejected at t=%g: %s", dt, time_, e.what());
        throw;
    }
}

void Simulation::commit(Configuration&& next, const double dt) {
    for (const BodyState& s : next) {
        if (!is_finite(s.position) || !is_finite(s.velocity)) {
            const auto [i, j] = closest_pair(snapshot());
            TraceLog(LOG_WARNING, "gravsim: step of dt=%g rejected at t=%g, state went non-finite", dt, time_);
            throw SingularConfiguration("step produced a non-finite state", i, j);
        }
    }
    for (std::size_t i = 0; i < bodies_.size(); ++i) bodies_[i].state = next[i];
    time_ += dt;
}

void Simulation::check_index(const char* operation, const std::size_t index) const {
    if (index >= bodies_.size()) throw OutOfRange(operation, index, bodies_.size());
}

}  // namespace gravsim
