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

#include <spool/core/config.hpp>

#define SPOOL_SYSTEM_NAMESPACE_BEGIN                                           \
    namespace spool::system                                                    \
    {

#define SPOOL_SYSTEM_NAMESPACE_END }

#define SPOOL_STAKE_NAMESPACE_BEGIN                                            \
    namespace spool::stake                                                     \
    {

#define SPOOL_STAKE_NAMESPACE_END }

#define SPOOL_TOKEN_NAMESPACE_BEGIN                                            \
    namespace spool::token                                                     \
    {

#define SPOOL_TOKEN_NAMESPACE_END }

#define SPOOL_VOTE_NAMESPACE_BEGIN                                             \
    namespace spool::vote                                                      \
    {

#define SPOOL_VOTE_NAMESPACE_END }

#define SPOOL_METADATA_NAMESPACE_BEGIN                                         \
    namespace spool::metadata                                                  \
    {

#define SPOOL_METADATA_NAMESPACE_END }
