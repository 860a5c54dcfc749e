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
#include <stdexcept>
#include <string>

namespace ckpbus {
namespace meta {

/**
 * A read that needs previously loaded messages ran before any load.
 * Caller bug; never retried.
 */
class PreconditionViolation : public std::logic_error {
public:
    explicit PreconditionViolation(const std::string& what) : std::logic_error(what) {}
};

/**
 * Retention could not delete every marker of an instant. Not thrown: logged
 * and handed to the bus cleanup callback, then retried on the next start.
 */
struct CleanupWarning {
    std::string instant;
    std::string message;
    size_t pending_instants = 0;  // cache size after the failed attempt
};

} // namespace meta
} // namespace ckpbus
