#pragma once

#include <stdexcept>

namespace reporter
{

/// Reporter used before initialize(), or a project the client cannot reach
class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Issue text could not be produced
class FormattingError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace reporter
