/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IECONOMY_HPP
#define IECONOMY_HPP

namespace Bulwark {

/**
 * @file IEconomy.hpp
 * @brief Money interface the simulation talks to
 *
 * The simulation never holds a balance. Tower placement and upgrades ask
 * canAfford()/spend(); enemy deaths, sales and wave completion call earn().
 */
class IEconomy {
public:
    virtual ~IEconomy() = default;

    virtual bool canAfford(int cost) const = 0;

    /**
     * @brief Deducts cost if affordable
     * @return false (and no change) when the balance is too low
     */
    virtual bool spend(int cost) = 0;

    virtual void earn(int amount) = 0;
};

} // namespace Bulwark

#endif // IECONOMY_HPP
