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
#include <string>
#include <vector>

namespace ckpbus { 
    namespace persist {

        struct FSResult { 
            bool ok; 
            int err; 
        };

        // Thin POSIX facade. Every call is independently atomic at the
        // filesystem level; nothing here spans more than one path.
        class PlatformFS {
        public:
            // O_CREAT|O_EXCL; err == EEXIST when the file was already there.
            // The new entry is not durable until the parent is fsynced.
            static FSResult create_exclusive(const std::string& path);
            static FSResult remove_file(const std::string& path);
            static FSResult remove_all(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
            static FSResult fsync_directory(const std::string& dir_path);

            // Names of the regular files directly under dir_path;
            // subdirectories, symlinks and other special entries are skipped
            static FSResult list_directory(const std::string& dir_path,
                                           std::vector<std::string>* out);

            static bool exists(const std::string& path);
            static bool is_directory(const std::string& path);
        };

    }
} // namespace ckpbus::persist
