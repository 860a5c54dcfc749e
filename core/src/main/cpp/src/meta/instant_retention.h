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
#include "ckp_errors.h"
#include "ckp_message_store.h"
#include <deque>
#include <optional>
#include <string>

namespace ckpbus {
namespace meta {

/**
 * Bounded-count cleaner for the coordinator's known instants.
 *
 * Instants are tracked in start order. Once more than max_retained are
 * tracked the oldest ones lose their markers; an instant whose markers could
 * not all be deleted stays at the front and is retried on the next clean().
 */
class InstantRetention {
public:
    struct CleanResult {
        size_t cleaned = 0;
        std::optional<CleanupWarning> failure;
    };

    explicit InstantRetention(size_t max_retained);

    // Append an instant; an instant already tracked keeps its position
    void track(const std::string& instant);

    // Delete markers of the oldest instants until at most max_retained are
    // tracked, stopping at the first instant that cannot be fully deleted
    CleanResult clean(CkpMessageStore& store);

    void clear() { instants_.clear(); }

    const std::deque<std::string>& instants() const { return instants_; }
    size_t max_retained() const { return max_retained_; }

private:
    size_t max_retained_;
    std::deque<std::string> instants_;
};

} // namespace meta
} // namespace ckpbus
