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

#include "ckp_reducer.h"
#include <map>

namespace ckpbus {
namespace meta {

std::vector<CkpMessage> reduce_messages(const std::vector<CkpMessage>& raw) {
    // std::map keeps the instants in ascending order for us
    std::map<std::string, CkpState> resolved;
    for (const auto& msg : raw) {
        auto [it, inserted] = resolved.try_emplace(msg.instant(), msg.state());
        if (!inserted && state_rank(msg.state()) > state_rank(it->second)) {
            it->second = msg.state();
        }
    }

    std::vector<CkpMessage> out;
    out.reserve(resolved.size());
    for (const auto& [instant, state] : resolved) {
        out.emplace_back(instant, state);
    }
    return out;
}

} // namespace meta
} // namespace ckpbus
