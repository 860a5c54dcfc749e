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

#include "local_storage.h"
#include "persistence_error.h"
#include "platform_fs.h"
#include "../util/log.h"
#include <cerrno>
#include <filesystem>

namespace ckpbus {
namespace persist {

CreateStatus LocalStorage::create_if_absent(const std::string& path) {
    FSResult res = PlatformFS::create_exclusive(path);
    if (!res.ok && res.err == ENOENT) {
        // Parent missing: create it like a recursive mkdir, then retry once
        std::string parent = std::filesystem::path(path).parent_path().string();
        FSResult dir_res = PlatformFS::ensure_directory(parent);
        if (!dir_res.ok) {
            throw PersistenceError("Failed to create directory", parent, dir_res.err);
        }
        res = PlatformFS::create_exclusive(path);
    }

    if (res.ok) {
        // The entry exists from here on; a failed sync must not report it missing
        std::string parent = std::filesystem::path(path).parent_path().string();
        FSResult sync_res = PlatformFS::fsync_directory(parent.empty() ? "." : parent);
        if (!sync_res.ok) {
            warning() << "fsync of " << parent << " after creating " << path
                      << " failed: " << errnoWithDescription(sync_res.err);
        }
        return CreateStatus::Created;
    }
    if (res.err == EEXIST) {
        return CreateStatus::AlreadyExists;
    }
    throw PersistenceError("Failed to create file", path, res.err);
}

std::vector<std::string> LocalStorage::list_entries(const std::string& dir) const {
    std::vector<std::string> names;
    if (!PlatformFS::is_directory(dir)) {
        return names;
    }

    FSResult res = PlatformFS::list_directory(dir, &names);
    if (!res.ok) {
        if (res.err == ENOENT) {
            // Removed between the check and the listing
            names.clear();
            return names;
        }
        throw PersistenceError("Failed to list directory", dir, res.err);
    }
    return names;
}

RemoveStatus LocalStorage::remove(const std::string& path) {
    FSResult res = PlatformFS::remove_file(path);
    if (res.ok) {
        return RemoveStatus::Removed;
    }
    if (res.err == ENOENT) {
        return RemoveStatus::NotFound;
    }
    throw PersistenceError("Failed to delete file", path, res.err);
}

bool LocalStorage::exists(const std::string& path) const {
    return PlatformFS::exists(path);
}

void LocalStorage::reset_directory(const std::string& dir) {
    FSResult res = PlatformFS::remove_all(dir);
    if (!res.ok) {
        throw PersistenceError("Failed to delete directory", dir, res.err);
    }

    res = PlatformFS::ensure_directory(dir);
    if (!res.ok) {
        throw PersistenceError("Failed to create directory", dir, res.err);
    }

    std::string parent = std::filesystem::path(dir).parent_path().string();
    if (!parent.empty()) {
        FSResult sync_res = PlatformFS::fsync_directory(parent);
        if (!sync_res.ok) {
            trace() << "fsync of " << parent << " failed: " << errnoWithDescription(sync_res.err);
        }
    }
}

} // namespace persist
} // namespace ckpbus
