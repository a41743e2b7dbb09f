#pragma once

#include <cstddef>
#include <vector>

#include "../core/Constants.hpp"
#include "../core/Vec3.hpp"
#include "Integrator.hpp"

namespace gravsim {

// Position and velocity of one body; every integrator advances them together.
struct BodyState {
    DVec3 position{};
    DVec3 velocity{};

    friend bool operator==(const BodyState&, const BodyState&) = default;
};

// Time derivative of a BodyState: (velocity, acceleration).
struct Derivative {
    DVec3 velocity{};
    DVec3 acceleration{};
};

struct Body {
    double mass = 1.0;
    BodyState state{};

    friend bool operator==(const Body&, const Body&) = default;
};

// Reference position/velocity for angular momentum. Defaults to the resting origin.
struct ReferenceFrame {
    DVec3 position{};
    DVec3 velocity{};
};

// Parallel per-axis coordinate lists, one entry per body in index order.
struct AxisSeries {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;
};

// Point masses under mutual Newtonian gravity, advanced with a selectable
// fixed-step integrator. Index is identity: removal shifts later bodies down
// by one, so any index-keyed state held by a caller goes stale.
//
// Every mutator either applies fully or throws and leaves the state intact.
class Simulation {
public:
    Simulation() = default;
    explicit Simulation(double g);

    // Bodies
    void add_body(double mass, const DVec3& position, const DVec3& velocity);
    void set_body(std::size_t index, double mass, const DVec3& position, const DVec3& velocity);
    void remove_body(std::size_t index);
    void clear();

    [[nodiscard]] const Body& body(std::size_t index) const;
    [[nodiscard]] const std::vector<Body>& bodies() const noexcept { return bodies_; }
    [[nodiscard]] std::size_t size() const noexcept { return bodies_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bodies_.empty(); }

    // Parameters and policy state
    [[nodiscard]] double gravitational_constant() const noexcept { return g_; }
    void set_gravitational_constant(double g);
    [[nodiscard]] double time() const noexcept { return time_; }
    void reset_time() noexcept { time_ = 0.0; }
    [[nodiscard]] bool is_running() const noexcept { return running_; }
    void set_running(bool running) noexcept { running_ = running; }
    void toggle_running() noexcept { running_ = !running_; }
    [[nodiscard]] Integrator integrator() const noexcept { return integrator_; }
    void set_integrator(Integrator integrator);

    // Net gravitational acceleration on body i if it had `state`, with every
    // other body at its stored position. Sums over j in ascending order.
    // Throws SingularConfiguration on a zero separation.
    [[nodiscard]] DVec3 compute_acceleration(std::size_t index, const BodyState& state) const;
    [[nodiscard]] DVec3 compute_acceleration(std::size_t index) const;

    // ODE right-hand side for body i: (velocity, acceleration).
    [[nodiscard]] Derivative derivative(std::size_t index, const BodyState& state) const;

    // Advances by dt with the selected integrator. Derivatives are evaluated
    // against a snapshot of the prior state and committed together; on error
    // nothing is written and time does not advance.
    void step(double dt);
    void step_euler(double dt);
    void step_semi_implicit_euler(double dt);
    void step_modified_euler(double dt);
    void step_runge_kutta(double dt);

    // Diagnostics
    [[nodiscard]] double kinetic_energy() const;
    [[nodiscard]] double potential_energy() const;
    [[nodiscard]] double total_energy() const;
    [[nodiscard]] DVec3 center_of_mass() const;
    [[nodiscard]] DVec3 linear_momentum() const;
    // Only the z component: orbits are assumed to lie in the xy plane.
    [[nodiscard]] double angular_momentum(const ReferenceFrame& frame = {}) const;
    [[nodiscard]] DVec3 angular_momentum_vector(const ReferenceFrame& frame = {}) const;
    [[nodiscard]] DVec3 net_force() const;
    [[nodiscard]] AxisSeries positions_by_axis() const;

    // Removes the center-of-mass drift so the system stays in view.
    void zero_net_momentum();

private:
    using Configuration = std::vector<BodyState>;

    [[nodiscard]] Configuration snapshot() const;
    [[nodiscard]] DVec3 acceleration_in(const Configuration& configuration, std::size_t index,
                                        const DVec3& position) const;
    // Same sum against the stored bodies, without copying them.
    [[nodiscard]] DVec3 acceleration_at(std::size_t index, const DVec3& position) const;
    [[nodiscard]] std::vector<Derivative> derivatives_in(const Configuration& configuration) const;
    // derivatives_in for a step; logs the rejected step before rethrowing.
    [[nodiscard]] std::vector<Derivative> stage(const Configuration& configuration, double dt) const;
    void commit(Configuration&& next, double dt);
    void check_index(const char* operation, std::size_t index) const;

    std::vector<Body> bodies_;
    double g_ = constants::default_g;
    double time_ = 0.0;
    bool running_ = true;
    Integrator integrator_ = default_integrator;
};

}  // namespace gravsim
