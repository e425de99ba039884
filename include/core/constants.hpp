/**
 * @file constants.hpp
 * @brief Annualization and numerical constants shared across the engine
 */

#ifndef EXPLORER_CORE_CONSTANTS_HPP
#define EXPLORER_CORE_CONSTANTS_HPP

namespace explorer
{
    /// Trading days used to annualize daily statistics
    constexpr int TRADING_DAYS_PER_YEAR = 252;

    /// Default annual risk-free rate for Sharpe ratios
    constexpr double DEFAULT_RISK_FREE_RATE = 0.03;

    /// Portfolio risk at or below this is treated as zero
    constexpr double RISK_EPSILON = 1e-12;

} // namespace explorer

#endif // EXPLORER_CORE_CONSTANTS_HPP
