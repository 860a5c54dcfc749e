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

#include <gmock/gmock.h>
#include <cerrno>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include "../../src/persistence/memory_storage.h"
#include "../../src/persistence/persistence_error.h"

namespace ckpbus::meta::test {

/**
 * StorageAdapter mock that forwards to a MemoryStorage unless a test
 * overrides a call (typically to inject a failure).
 */
class MockStorage : public persist::StorageAdapter {
public:
    MockStorage() {
        using ::testing::_;
        using ::testing::Invoke;
        ON_CALL(*this, create_if_absent(_))
            .WillByDefault(Invoke(&real_, &persist::MemoryStorage::create_if_absent));
        ON_CALL(*this, list_entries(_))
            .WillByDefault(Invoke(&real_, &persist::MemoryStorage::list_entries));
        ON_CALL(*this, remove(_))
            .WillByDefault(Invoke(&real_, &persist::MemoryStorage::remove));
        ON_CALL(*this, exists(_))
            .WillByDefault(Invoke(&real_, &persist::MemoryStorage::exists));
        ON_CALL(*this, reset_directory(_))
            .WillByDefault(Invoke(&real_, &persist::MemoryStorage::reset_directory));
    }

    MOCK_METHOD(persist::CreateStatus, create_if_absent, (const std::string& path), (override));
    MOCK_METHOD(std::vector<std::string>, list_entries, (const std::string& dir), (const, override));
    MOCK_METHOD(persist::RemoveStatus, remove, (const std::string& path), (override));
    MOCK_METHOD(bool, exists, (const std::string& path), (const, override));
    MOCK_METHOD(void, reset_directory, (const std::string& dir), (override));

    persist::MemoryStorage& real() { return real_; }

private:
    persist::MemoryStorage real_;
};

inline persist::PersistenceError io_error(const std::string& path) {
    return persist::PersistenceError("injected failure", path, EIO);
}

inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    // Generate random suffix
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

} // namespace ckpbus::meta::test
