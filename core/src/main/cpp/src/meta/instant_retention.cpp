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

#include "instant_retention.h"
#include "../util/log.h"
#include <algorithm>
#include <stdexcept>

namespace ckpbus {
namespace meta {

InstantRetention::InstantRetention(size_t max_retained)
    : max_retained_(max_retained) {
    if (max_retained_ < 1) {
        throw std::invalid_argument("InstantRetention: max_retained must be at least 1");
    }
}

void InstantRetention::track(const std::string& instant) {
    // A restarted (previously aborted) instant shares its markers with the
    // first attempt; a second entry would delete them while still in use
    if (std::find(instants_.begin(), instants_.end(), instant) != instants_.end()) {
        return;
    }
    instants_.push_back(instant);
}

InstantRetention::CleanResult InstantRetention::clean(CkpMessageStore& store) {
    CleanResult result;
    while (instants_.size() > max_retained_) {
        const std::string oldest = instants_.front();
        if (!store.delete_all(oldest)) {
            CleanupWarning w;
            w.instant = oldest;
            w.message = "Failed to delete checkpoint markers of instant " + oldest +
                        " under " + store.path() + ", will retry on next start";
            w.pending_instants = instants_.size();
            result.failure = std::move(w);
            break;
        }
        instants_.pop_front();
        ++result.cleaned;
        debug() << "[CKP_CLEAN] removed markers of instant " << oldest;
    }
    return result;
}

} // namespace meta
} // namespace ckpbus
