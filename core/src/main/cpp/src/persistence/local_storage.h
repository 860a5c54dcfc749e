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

namespace ckpbus {
    namespace persist {

        // StorageAdapter over a local (or locally mounted) POSIX filesystem
        class LocalStorage final : public StorageAdapter {
        public:
            CreateStatus create_if_absent(const std::string& path) override;
            std::vector<std::string> list_entries(const std::string& dir) const override;
            RemoveStatus remove(const std::string& path) override;
            bool exists(const std::string& path) const override;
            void reset_directory(const std::string& dir) override;
        };
    }
}
