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
#include <cstring>
#include <stdexcept>
#include <string>

namespace ckpbus {
namespace persist {

/**
 * A storage operation failed for a reason other than the benign
 * "already exists" / "not found" outcomes the adapters report as status.
 */
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& what, const std::string& path, int err = 0)
        : std::runtime_error(format(what, path, err)), path_(path), err_(err) {}

    const std::string& path() const noexcept { return path_; }

    // errno of the failed call, 0 if not a syscall failure
    int error_code() const noexcept { return err_; }

private:
    static std::string format(const std::string& what, const std::string& path, int err) {
        std::string msg = what + ": " + path;
        if (err != 0) {
            msg += " (errno:" + std::to_string(err) + " " + std::strerror(err) + ")";
        }
        return msg;
    }

    std::string path_;
    int err_;
};

} // namespace persist
} // namespace ckpbus
