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

#include <spool/pool/config.hpp>
#include <spool/runtime/pubkey.hpp>

SPOOL_POOL_NAMESPACE_BEGIN

// SVSPxpvHdN29nkVg9rPapPNDddN5DipNLRUFhyjFThE
inline constexpr Pubkey SINGLE_POOL_PROGRAM_ID{
    0x0687accdfdec68a1620ce43beb02d173a49f3866c4a83e3a7ded3264a7f8e895_bytes32};

SPOOL_POOL_NAMESPACE_END
