#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gravsim {

// Base for every error the simulation core raises. None of them leave a
// Simulation in a partially modified state.
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Body index outside [0, size()).
class OutOfRange : public SimulationError {
public:
    OutOfRange(const std::string& operation, std::size_t index, std::size_t size)
        : SimulationError(operation + ": body index " + std::to_string(index) + " out of range (size " +
                          std::to_string(size) + ")"),
          index_(index) {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

// Query that needs at least one body (or a positive total mass).
class EmptySystem : public SimulationError {
public:
    explicit EmptySystem(const std::string& operation) : SimulationError(operation + ": no bodies in the system") {}
};

// Two bodies collapsed onto each other, or the force between them overflowed.
class SingularConfiguration : public SimulationError {
public:
    SingularConfiguration(const std::string& what, std::size_t first, std::size_t second)
        : SimulationError(what + " (bodies " + std::to_string(first) + " and " + std::to_string(second) + ")"),
          first_(first),
          second_(second) {}

    [[nodiscard]] std::size_t first() const noexcept { return first_; }
    [[nodiscard]] std::size_t second() const noexcept { return second_; }

private:
    std::size_t first_;
    std::size_t second_;
};

class UnsupportedStrategy : public SimulationError {
public:
    explicit UnsupportedStrategy(const std::string& name) : SimulationError("unsupported integrator: " + name) {}
};

// Rejected input: non-positive mass, non-finite components, negative dt.
class InvalidArgument : public SimulationError {
public:
    using SimulationError::SimulationError;
};

}  // namespace gravsim
