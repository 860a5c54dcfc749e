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
#include "storage_adapter.h"
#include <map>
#include <mutex>
#include <set>

namespace ckpbus {
    namespace persist {

        /**
         * StorageAdapter over a process-local map. Directories exist only
         * once created (explicitly or as the parent of a new entry). Safe to
         * share between one writer bus and any number of reader buses.
         */
        class MemoryStorage final : public StorageAdapter {
        public:
            CreateStatus create_if_absent(const std::string& path) override;
            std::vector<std::string> list_entries(const std::string& dir) const override;
            RemoveStatus remove(const std::string& path) override;
            bool exists(const std::string& path) const override;
            void reset_directory(const std::string& dir) override;

            // Total entries across all directories
            size_t size() const;

        private:
            static std::pair<std::string, std::string> split(const std::string& path);
            static std::string normalize(const std::string& dir);

            mutable std::mutex mutex_;
            std::map<std::string, std::set<std::string>> dirs_;  // dir -> entry names
        };
    }
}
