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

#include "ckp_message_store.h"
#include "../persistence/persistence_error.h"
#include "../util/log.h"

namespace ckpbus {
namespace meta {

CkpMessageStore::CkpMessageStore(persist::StorageAdapter& storage, std::string path)
    : storage_(storage), path_(std::move(path)) {
}

void CkpMessageStore::reset() {
    storage_.reset_directory(path_);
}

void CkpMessageStore::append(const std::string& instant, CkpState state) {
    std::string file = storage_.join(path_, CkpMessageCodec::encode(instant, state));
    if (storage_.create_if_absent(file) == persist::CreateStatus::AlreadyExists) {
        debug() << "[CKP_APPEND] marker already present: " << file;
    }
}

std::vector<CkpMessage> CkpMessageStore::scan() const {
    std::vector<CkpMessage> messages;

    // Object stores may refuse to list a missing prefix
    if (!storage_.exists(path_)) {
        return messages;
    }

    std::vector<std::string> names = storage_.list_entries(path_);
    messages.reserve(names.size());
    for (const auto& name : names) {
        auto msg = CkpMessageCodec::decode(name);
        if (!msg) {
            debug() << "[CKP_SCAN] skipping stray entry " << name << " under " << path_;
            continue;
        }
        messages.push_back(std::move(*msg));
    }
    return messages;
}

bool CkpMessageStore::delete_all(const std::string& instant) {
    bool ok = true;
    for (const auto& name : CkpMessageCodec::all_file_names(instant)) {
        std::string file = storage_.join(path_, name);
        try {
            storage_.remove(file);
        } catch (const persist::PersistenceError& e) {
            ok = false;
            warning() << "Exception while cleaning the checkpoint meta file: " << file
                      << ": " << e.what();
        }
    }
    return ok;
}

} // namespace meta
} // namespace ckpbus
