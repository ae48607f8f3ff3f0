#pragma once

#include <stdexcept>
#include <string>

namespace amroute
{

/// Invalid decoder or decode-call configuration. Raised before any tensor work.
class ConfigError : public std::invalid_argument
{
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

/// Tensor rank/dimension mismatch between the decoder and its collaborators.
class ShapeError : public std::runtime_error
{
public:
    explicit ShapeError(const std::string& what) : std::runtime_error(what) {}
};

/// The environment left an active trajectory without a legal action,
/// or a selected action is forbidden by the mask.
class InfeasibleStepError : public std::runtime_error
{
public:
    explicit InfeasibleStepError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace amroute
