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

#include <spool/core/base58.hpp>
#include <spool/core/ed25519.hpp>
#include <spool/core/likely.h>
#include <spool/core/sha256.hpp>
#include <spool/runtime/pubkey.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <algorithm>
#include <cstring>
#include <vector>

SPOOL_NAMESPACE_BEGIN

Result<Pubkey>
create_program_address(Seeds const seeds, Pubkey const &program_id)
{
    if (SPOOL_UNLIKELY(seeds.size() > MAX_SEEDS)) {
        return PubkeyError::MaxSeedLengthExceeded;
    }

    Sha256 hasher;
    for (auto const &seed : seeds) {
        if (SPOOL_UNLIKELY(seed.size() > MAX_SEED_LEN)) {
            return PubkeyError::MaxSeedLengthExceeded;
        }
        hasher.update(seed);
    }
    hasher.update({program_id.bytes, sizeof(program_id.bytes)});
    hasher.update(to_byte_string_view(PDA_MARKER));
    Pubkey const address = hasher.finalize();

    if (is_on_curve(address)) {
        return PubkeyError::InvalidSeeds;
    }
    return address;
}

Result<std::pair<Pubkey, uint8_t>>
try_find_program_address(Seeds const seeds, Pubkey const &program_id)
{
    if (SPOOL_UNLIKELY(seeds.size() >= MAX_SEEDS)) {
        return PubkeyError::MaxSeedLengthExceeded;
    }

    std::vector<byte_string_view> with_bump{seeds.begin(), seeds.end()};
    unsigned char bump = 255;
    with_bump.emplace_back(&bump, 1);
    while (true) {
        auto res = create_program_address(with_bump, program_id);
        if (res.has_value()) {
            return std::make_pair(res.value(), bump);
        }
        if (res.assume_error() != PubkeyError::InvalidSeeds) {
            return std::move(res).as_failure();
        }
        if (bump == 0) {
            return PubkeyError::NoViableBump;
        }
        --bump;
    }
}

Result<Pubkey> create_with_seed(
    Pubkey const &base, std::string_view const seed, Pubkey const &owner)
{
    if (SPOOL_UNLIKELY(seed.size() > MAX_SEED_LEN)) {
        return PubkeyError::MaxSeedLengthExceeded;
    }

    // an owner ending in the marker could forge program derived addresses
    constexpr size_t marker_size = PDA_MARKER.size();
    if (SPOOL_UNLIKELY(
            std::memcmp(
                owner.bytes + sizeof(owner.bytes) - marker_size,
                PDA_MARKER.data(),
                marker_size) == 0)) {
        return PubkeyError::IllegalOwner;
    }

    return Sha256{}
        .update({base.bytes, sizeof(base.bytes)})
        .update(to_byte_string_view(seed))
        .update({owner.bytes, sizeof(owner.bytes)})
        .finalize();
}

std::string to_string(Pubkey const &key)
{
    return base58_encode({key.bytes, sizeof(key.bytes)});
}

Result<Pubkey> parse_pubkey(std::string_view const text)
{
    BOOST_OUTCOME_TRY(auto const decoded, base58_decode(text));
    if (SPOOL_UNLIKELY(decoded.size() != sizeof(Pubkey))) {
        return PubkeyError::InvalidLength;
    }
    Pubkey key;
    std::ranges::copy(decoded, key.bytes);
    return key;
}

SPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<spool::PubkeyError>::mapping> const &
quick_status_code_from_enum<spool::PubkeyError>::value_mappings()
{
    using spool::PubkeyError;

    static std::initializer_list<mapping> const v = {
        {PubkeyError::Success, "success", {errc::success}},
        {PubkeyError::MaxSeedLengthExceeded,
         "length of the seed is too long for address generation",
         {}},
        {PubkeyError::InvalidSeeds,
         "provided seeds do not result in a valid address",
         {}},
        {PubkeyError::IllegalOwner, "provided owner is not allowed", {}},
        {PubkeyError::NoViableBump, "unable to find a viable bump seed", {}},
        {PubkeyError::InvalidLength, "pubkey must be 32 bytes", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
