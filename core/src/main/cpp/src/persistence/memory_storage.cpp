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

#include "memory_storage.h"
#include "persistence_error.h"
#include <cerrno>

namespace ckpbus {
namespace persist {

std::string MemoryStorage::normalize(const std::string& dir) {
    std::string d = dir;
    while (d.size() > 1 && d.back() == '/') {
        d.pop_back();
    }
    return d;
}

std::pair<std::string, std::string> MemoryStorage::split(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return {".", path};
    }
    if (pos == 0) {
        return {"/", path.substr(1)};
    }
    return {path.substr(0, pos), path.substr(pos + 1)};
}

CreateStatus MemoryStorage::create_if_absent(const std::string& path) {
    auto [dir, name] = split(path);
    if (name.empty()) {
        throw PersistenceError("Failed to create file", path, EINVAL);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (dirs_.count(normalize(path)) != 0) {
        // A directory already occupies this path
        throw PersistenceError("Failed to create file", path, EISDIR);
    }
    auto& entries = dirs_[normalize(dir)];
    return entries.insert(name).second ? CreateStatus::Created : CreateStatus::AlreadyExists;
}

std::vector<std::string> MemoryStorage::list_entries(const std::string& dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dirs_.find(normalize(dir));
    if (it == dirs_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

RemoveStatus MemoryStorage::remove(const std::string& path) {
    auto [dir, name] = split(path);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dirs_.find(normalize(dir));
    if (it == dirs_.end() || it->second.erase(name) == 0) {
        return RemoveStatus::NotFound;
    }
    return RemoveStatus::Removed;
}

bool MemoryStorage::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string p = normalize(path);
    if (dirs_.count(p) != 0) {
        return true;
    }
    auto [dir, name] = split(p);
    auto it = dirs_.find(normalize(dir));
    return it != dirs_.end() && it->second.count(name) != 0;
}

void MemoryStorage::reset_directory(const std::string& dir) {
    std::string d = normalize(dir);
    std::string prefix = (d == "/") ? d : d + "/";

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = dirs_.begin(); it != dirs_.end();) {
        if (it->first == d || it->first.compare(0, prefix.size(), prefix) == 0) {
            it = dirs_.erase(it);
        } else {
            ++it;
        }
    }
    dirs_[d];
}

size_t MemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& kv : dirs_) {
        total += kv.second.size();
    }
    return total;
}

} // namespace persist
} // namespace ckpbus
