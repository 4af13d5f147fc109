#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error raised when an argument's shape matches none of the variants an operation accepts.
 */
class TypeInputError : public std::invalid_argument
{
  public:
    /**
     * @brief Construct the error.
     *
     * @param[in] message Description of the rejected argument
     */
    explicit TypeInputError(const std::string& message) : std::invalid_argument(message)
    {
    }
};
