// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <lockstake/staking/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

LOCKSTAKE_STAKING_NAMESPACE_BEGIN

enum class StakingError
{
    Success = 0,
    InvalidLevel,
    InvalidStakeId,
    InvalidExternalId,
    AlreadyAttached,
    NoActiveStaking,
    TokensStillLocked,
    Unauthorized,
    TransferFailed,
    InvalidInput,
    InvalidLevelTable,
    EscrowNotFound,
};

LOCKSTAKE_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<lockstake::staking::StakingError>
    : quick_status_code_from_enum_defaults<lockstake::staking::StakingError>
{
    static constexpr auto const domain_name = "Staking Error";
    static constexpr auto const domain_uuid =
        "8f3c2d71-4b6a-4e0f-b1d9-2a7c5e9f0d34";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
