// LIQUIDSTAKE - Staking Engine
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Stake and unstake orchestration: moves values between the staker, the
// validator and the issuer, then updates the exchange-rate ledger. Every
// step that can fail is undone before an error is returned.

#ifndef LIQUIDSTAKE_STAKING_STAKING_ENGINE_H
#define LIQUIDSTAKE_STAKING_STAKING_ENGINE_H

#include "liquidstake/asset/token_issuer.h"
#include "liquidstake/core/status.h"
#include "liquidstake/core/types.h"
#include "liquidstake/staking/events.h"
#include "liquidstake/staking/exchange_rate.h"
#include "liquidstake/staking/lp_rewards.h"
#include "liquidstake/staking/pool.h"
#include "liquidstake/staking/validator_service.h"

namespace liquidstake {

namespace ledger {
class ILedger;
}

namespace staking {

class StakingEngine {
public:
    StakingEngine(ledger::ILedger& ledger,
                  IValidatorService& validators,
                  asset::TokenIssuer& issuer,
                  ExchangeRateLedger& rates,
                  LpRewardLedger& lpRewards,
                  const EventSink& events);

    /**
     * Delegate amount base units from staker to the pool validator and
     * mint the same amount of staked tokens to the staker.
     *
     * @return BELOW_MINIMUM_STAKE, ABOVE_MAXIMUM_STAKE, STAKE_OVERFLOW,
     *         INSUFFICIENT_BALANCE, ACCOUNT_FROZEN or VALIDATOR_CALL_FAILED
     */
    Status Stake(const PoolState& pool, const asset::IssuerCapabilities& caps,
                 const Address& staker, Amount amount);

    /**
     * Burn amount staked tokens from staker and return the converted base
     * amount from the validator.
     *
     * @param[out] baseReturned Base units paid back (may be nullptr)
     * @return ZERO_AMOUNT, UNSTAKE_TOO_SMALL, INSUFFICIENT_STAKED,
     *         INSUFFICIENT_BALANCE, ACCOUNT_FROZEN or VALIDATOR_CALL_FAILED
     */
    Status Unstake(const PoolState& pool, const asset::IssuerCapabilities& caps,
                   const Address& staker, Amount amount, Amount* baseReturned);

private:
    ledger::ILedger& ledger_;
    IValidatorService& validators_;
    asset::TokenIssuer& issuer_;
    ExchangeRateLedger& rates_;
    LpRewardLedger& lpRewards_;
    const EventSink& events_;
};

} // namespace staking
} // namespace liquidstake

#endif // LIQUIDSTAKE_STAKING_STAKING_ENGINE_H
