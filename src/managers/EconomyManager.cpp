/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EconomyManager.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Bulwark {

EconomyManager::EconomyManager(int startingMoney) {
    reset(startingMoney);
}

bool EconomyManager::canAfford(int cost) const {
    return cost >= 0 && cost <= m_balance;
}

bool EconomyManager::spend(int cost) {
    if (!canAfford(cost)) {
        ECONOMY_DEBUG(std::format("Cannot spend {} with balance {}", cost, m_balance));
        return false;
    }
    m_balance -= cost;
    m_totalSpent += cost;
    return true;
}

void EconomyManager::earn(int amount) {
    if (amount < 0) {
        ECONOMY_WARN(std::format("EconomyManager::earn - ignoring negative amount {}", amount));
        return;
    }
    m_balance += amount;
    m_totalEarned += amount;
}

void EconomyManager::reset(int startingMoney) {
    m_balance = startingMoney < 0 ? 0 : startingMoney;
    m_totalEarned = 0;
    m_totalSpent = 0;
    ECONOMY_INFO(std::format("Economy reset, balance {}", m_balance));
}

} // namespace Bulwark
