/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ECONOMY_MANAGER_HPP
#define ECONOMY_MANAGER_HPP

#include "core/IEconomy.hpp"
#include <cstdint>

namespace Bulwark {

/**
 * @brief Player wallet with running totals
 *
 * Negative amounts are rejected: spend(-5) returns false and earn(-5) is
 * ignored with a warning.
 */
class EconomyManager : public IEconomy {
public:
    explicit EconomyManager(int startingMoney = 0);

    bool canAfford(int cost) const override;
    bool spend(int cost) override;
    void earn(int amount) override;

    // Restores the starting balance and zeroes the totals
    void reset(int startingMoney);

    int getBalance() const { return m_balance; }
    int64_t getTotalEarned() const { return m_totalEarned; }
    int64_t getTotalSpent() const { return m_totalSpent; }

private:
    int m_balance{0};
    int64_t m_totalEarned{0};
    int64_t m_totalSpent{0};
};

} // namespace Bulwark

#endif // ECONOMY_MANAGER_HPP
