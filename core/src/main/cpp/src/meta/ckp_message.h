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
#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace ckpbus {
namespace meta {

/**
 * Lifecycle state of an instant as recorded by one marker.
 *
 * The enumeration is closed; its total order is defined by state_rank(),
 * not by the enumerator values.
 */
enum class CkpState : uint8_t {
    Inflight,
    Aborted,
    Completed
};

constexpr std::array<CkpState, 3> kAllStates = {
    CkpState::Inflight, CkpState::Aborted, CkpState::Completed
};

// INFLIGHT < ABORTED < COMPLETED
constexpr int state_rank(CkpState s) noexcept {
    switch (s) {
        case CkpState::Inflight:  return 0;
        case CkpState::Aborted:   return 1;
        case CkpState::Completed: return 2;
    }
    return -1;
}

// Lower-case marker suffix ("inflight", "aborted", "completed")
const char* to_string(CkpState s) noexcept;
std::optional<CkpState> state_from_string(const std::string& s);

std::ostream& operator<<(std::ostream& os, CkpState s);

/**
 * One (instant, state) pair. Immutable once built.
 */
class CkpMessage {
public:
    CkpMessage(std::string instant, CkpState state)
        : instant_(std::move(instant)), state_(state) {}

    const std::string& instant() const { return instant_; }
    CkpState state() const { return state_; }

    bool is_inflight() const { return state_ == CkpState::Inflight; }
    bool is_aborted() const { return state_ == CkpState::Aborted; }
    bool is_complete() const { return state_ == CkpState::Completed; }

    // Instant order first, then state rank
    bool operator<(const CkpMessage& o) const {
        if (instant_ != o.instant_) {
            return instant_ < o.instant_;
        }
        return state_rank(state_) < state_rank(o.state_);
    }
    bool operator==(const CkpMessage& o) const {
        return state_ == o.state_ && instant_ == o.instant_;
    }
    bool operator!=(const CkpMessage& o) const { return !(*this == o); }

private:
    std::string instant_;
    CkpState state_;
};

std::ostream& operator<<(std::ostream& os, const CkpMessage& m);

/**
 * Marker name codec: "<instant>.<state>".
 *
 * decode() splits at the last '.', so instants may themselves contain dots.
 */
class CkpMessageCodec {
public:
    static constexpr char kSeparator = '.';

    // Throws std::invalid_argument for an empty instant or one containing '/'
    static std::string encode(const std::string& instant, CkpState state);
    static std::string encode(const CkpMessage& msg) { return encode(msg.instant(), msg.state()); }

    // nullopt for any name encode() cannot produce
    static std::optional<CkpMessage> decode(const std::string& name);

    // Every marker name the instant could have, in rank order
    static std::array<std::string, 3> all_file_names(const std::string& instant);

    static void validate_instant(const std::string& instant);
};

} // namespace meta
} // namespace ckpbus
