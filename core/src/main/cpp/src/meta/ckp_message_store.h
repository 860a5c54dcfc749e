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
#include "ckp_message.h"
#include "../persistence/storage_adapter.h"
#include <string>
#include <vector>

namespace ckpbus {
namespace meta {

/**
 * Marker files for one bus directory.
 *
 * Owns nothing durable itself; the directory lives in the StorageAdapter and
 * is shared by one writer and any number of readers.
 */
class CkpMessageStore {
public:
    CkpMessageStore(persist::StorageAdapter& storage, std::string path);

    // Wipe and recreate the directory
    void reset();

    // Write one marker. An existing marker is a benign duplicate.
    // Throws PersistenceError on any other failure.
    void append(const std::string& instant, CkpState state);

    // Decode every marker in the directory, skipping names that are not
    // markers. Empty when the directory does not exist.
    std::vector<CkpMessage> scan() const;

    // Delete every marker of the instant, whatever its state.
    // Returns false if any delete failed; every name is still attempted.
    bool delete_all(const std::string& instant);

    const std::string& path() const { return path_; }

private:
    persist::StorageAdapter& storage_;
    std::string path_;
};

} // namespace meta
} // namespace ckpbus
