/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONFIGURATION_ERROR_HPP
#define CONFIGURATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace Bulwark {

/**
 * @brief Broken or incomplete game data (missing definitions, bad references)
 *
 * Thrown while loading; a simulation is never constructed from data that
 * failed validation.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Bulwark

#endif // CONFIGURATION_ERROR_HPP
