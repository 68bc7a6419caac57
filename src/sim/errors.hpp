// src/sim/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace sim {

// Invalid timing, sensor, channel or scene-family configuration.
// Raised before any stepping happens.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Lifecycle operation called in the wrong controller or bridge state.
class SequencingError : public std::runtime_error {
public:
    explicit SequencingError(const std::string& what)
        : std::runtime_error(what) {}
};

// Scene could not be produced for (scene_id, seed); fatal for that reset only.
class SceneLoadError : public std::runtime_error {
public:
    explicit SceneLoadError(const std::string& what)
        : std::runtime_error(what) {}
};

class SceneNotFoundError : public SceneLoadError {
public:
    explicit SceneNotFoundError(const std::string& what)
        : SceneLoadError(what) {}
};

class SceneInvalidError : public SceneLoadError {
public:
    explicit SceneInvalidError(const std::string& what)
        : SceneLoadError(what) {}
};

} // namespace sim
