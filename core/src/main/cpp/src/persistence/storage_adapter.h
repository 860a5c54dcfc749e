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
#include <cstdint>
#include <string>
#include <vector>

namespace ckpbus {
    namespace persist {

        enum class CreateStatus : uint8_t {
            Created,
            AlreadyExists
        };

        enum class RemoveStatus : uint8_t {
            Removed,
            NotFound
        };

        /**
         * Capability interface over a key-existence store (local disk, object
         * store, in-memory map). Entries are content-less: existence is the
         * payload. Each call is atomic on its own; no call spans paths.
         *
         * Failures other than the benign outcomes encoded in the status enums
         * throw PersistenceError.
         */
        class StorageAdapter {
        public:
            virtual ~StorageAdapter() = default;

            // 1) Create an empty entry unless one already exists
            virtual CreateStatus create_if_absent(const std::string& path) = 0;

            // 2) Names of the plain entries directly under dir (no subdirectories); empty if dir is absent
            virtual std::vector<std::string> list_entries(const std::string& dir) const = 0;

            // 3) Delete one entry; a missing entry is not an error
            virtual RemoveStatus remove(const std::string& path) = 0;

            // 4) Existence of a file or directory
            virtual bool exists(const std::string& path) const = 0;

            // 5) Destructive: delete dir with everything under it, then recreate it empty
            virtual void reset_directory(const std::string& dir) = 0;

            // Join a directory and an entry name the way this store expects
            virtual std::string join(const std::string& dir, const std::string& name) const {
                if (dir.empty() || dir.back() == '/') {
                    return dir + name;
                }
                return dir + "/" + name;
            }
        };

    } // namespace persist
} // namespace ckpbus
