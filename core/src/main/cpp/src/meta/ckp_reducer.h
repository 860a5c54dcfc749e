/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include "ckp_message.h"
#include <vector>

namespace ckpbus {
namespace meta {

/**
 * Resolve a raw marker scan into one message per instant.
 *
 * Markers are grouped by instant and each group collapses to its highest
 * ranked state; duplicates of the same state collapse to one. The result is
 * sorted ascending by instant id, so the last element is the most recent
 * instant. Pure: no I/O, input untouched.
 */
std::vector<CkpMessage> reduce_messages(const std::vector<CkpMessage>& raw);

} // namespace meta
} // namespace ckpbus
