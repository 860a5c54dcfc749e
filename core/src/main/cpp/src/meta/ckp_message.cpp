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

#include "ckp_message.h"
#include <stdexcept>

namespace ckpbus {
namespace meta {

const char* to_string(CkpState s) noexcept {
    switch (s) {
        case CkpState::Inflight:  return "inflight";
        case CkpState::Aborted:   return "aborted";
        case CkpState::Completed: return "completed";
    }
    return "unknown";
}

std::optional<CkpState> state_from_string(const std::string& s) {
    for (CkpState state : kAllStates) {
        if (s == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, CkpState s) {
    return os << to_string(s);
}

std::ostream& operator<<(std::ostream& os, const CkpMessage& m) {
    return os << "(" << m.instant() << ", " << m.state() << ")";
}

void CkpMessageCodec::validate_instant(const std::string& instant) {
    if (instant.empty()) {
        throw std::invalid_argument("Checkpoint instant must not be empty");
    }
    if (instant.find('/') != std::string::npos) {
        throw std::invalid_argument("Checkpoint instant must not contain '/': " + instant);
    }
}

std::string CkpMessageCodec::encode(const std::string& instant, CkpState state) {
    validate_instant(instant);
    std::string name;
    name.reserve(instant.size() + 10);
    name.append(instant);
    name.push_back(kSeparator);
    name.append(to_string(state));
    return name;
}

std::optional<CkpMessage> CkpMessageCodec::decode(const std::string& name) {
    auto pos = name.find_last_of(kSeparator);
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }

    auto state = state_from_string(name.substr(pos + 1));
    if (!state) {
        return std::nullopt;
    }

    std::string instant = name.substr(0, pos);
    if (instant.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return CkpMessage(std::move(instant), *state);
}

std::array<std::string, 3> CkpMessageCodec::all_file_names(const std::string& instant) {
    return {
        encode(instant, CkpState::Inflight),
        encode(instant, CkpState::Aborted),
        encode(instant, CkpState::Completed)
    };
}

} // namespace meta
} // namespace ckpbus
