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

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include "../../src/persistence/local_storage.h"
#include "../../src/persistence/memory_storage.h"
#include "../../src/persistence/persistence_error.h"
#include "../../src/persistence/platform_fs.h"

using namespace ckpbus::persist;
namespace fs = std::filesystem;

// Same contract, two backends
template <typename T>
class StorageAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = (fs::temp_directory_path() /
                 ("ckpbus_storage_test_" + std::to_string(getpid()))).string();
        fs::remove_all(root_);
        dir_ = root_ + "/bus";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::vector<std::string> sorted_entries() {
        auto names = storage_.list_entries(dir_);
        std::sort(names.begin(), names.end());
        return names;
    }

    T storage_;
    std::string root_;
    std::string dir_;
};

using Backends = ::testing::Types<LocalStorage, MemoryStorage>;
TYPED_TEST_SUITE(StorageAdapterTest, Backends);

TYPED_TEST(StorageAdapterTest, ListOfAbsentDirectoryIsEmpty) {
    EXPECT_FALSE(this->storage_.exists(this->dir_));
    EXPECT_TRUE(this->storage_.list_entries(this->dir_).empty());
}

TYPED_TEST(StorageAdapterTest, CreateIfAbsent) {
    this->storage_.reset_directory(this->dir_);
    std::string path = this->storage_.join(this->dir_, "t1.inflight");

    EXPECT_EQ(this->storage_.create_if_absent(path), CreateStatus::Created);
    EXPECT_EQ(this->storage_.create_if_absent(path), CreateStatus::AlreadyExists);
    EXPECT_TRUE(this->storage_.exists(path));
    EXPECT_EQ(this->sorted_entries(), (std::vector<std::string>{"t1.inflight"}));
}

TYPED_TEST(StorageAdapterTest, CreateMakesMissingParent) {
    std::string path = this->storage_.join(this->dir_, "t1.inflight");
    EXPECT_EQ(this->storage_.create_if_absent(path), CreateStatus::Created);
    EXPECT_TRUE(this->storage_.exists(this->dir_));
}

TYPED_TEST(StorageAdapterTest, Remove) {
    this->storage_.reset_directory(this->dir_);
    std::string path = this->storage_.join(this->dir_, "t1.inflight");
    this->storage_.create_if_absent(path);

    EXPECT_EQ(this->storage_.remove(path), RemoveStatus::Removed);
    EXPECT_EQ(this->storage_.remove(path), RemoveStatus::NotFound);
    EXPECT_FALSE(this->storage_.exists(path));
    EXPECT_TRUE(this->storage_.list_entries(this->dir_).empty());
}

TYPED_TEST(StorageAdapterTest, ResetDirectoryWipesContent) {
    this->storage_.reset_directory(this->dir_);
    for (const char* n : {"a.inflight", "b.completed"}) {
        this->storage_.create_if_absent(this->storage_.join(this->dir_, n));
    }
    this->storage_.reset_directory(this->dir_);
    EXPECT_TRUE(this->storage_.exists(this->dir_));
    EXPECT_TRUE(this->storage_.list_entries(this->dir_).empty());
}

TYPED_TEST(StorageAdapterTest, JoinHandlesTrailingSlash) {
    EXPECT_EQ(this->storage_.join("/a/b", "c"), "/a/b/c");
    EXPECT_EQ(this->storage_.join("/a/b/", "c"), "/a/b/c");
}

class LocalStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = (fs::temp_directory_path() /
                ("ckpbus_local_storage_test_" + std::to_string(getpid()))).string();
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(dir_, fs::perms::owner_all, ec);
        fs::remove_all(dir_, ec);
    }

    std::string dir_;
    LocalStorage storage_;
};

TEST_F(LocalStorageTest, CreateFailureThrowsWithPathAndErrno) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    fs::permissions(dir_, fs::perms::owner_read | fs::perms::owner_exec);

    std::string path = dir_ + "/t1.inflight";
    try {
        storage_.create_if_absent(path);
        FAIL() << "expected PersistenceError";
    } catch (const PersistenceError& e) {
        EXPECT_EQ(e.path(), path);
        EXPECT_EQ(e.error_code(), EACCES);
    }
}

TEST_F(LocalStorageTest, RemoveFailureThrows) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    std::string path = dir_ + "/t1.inflight";
    ASSERT_EQ(storage_.create_if_absent(path), CreateStatus::Created);
    fs::permissions(dir_, fs::perms::owner_read | fs::perms::owner_exec);
    EXPECT_THROW(storage_.remove(path), PersistenceError);
}

TEST_F(LocalStorageTest, CreateSucceedsWhenParentSyncFails) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    // Write and search permission only: the entry can be created but the
    // directory cannot be opened for fsync
    fs::permissions(dir_, fs::perms::owner_write | fs::perms::owner_exec);
    ASSERT_FALSE(PlatformFS::fsync_directory(dir_).ok);

    std::string path = dir_ + "/t1.inflight";
    EXPECT_EQ(storage_.create_if_absent(path), CreateStatus::Created);
    EXPECT_EQ(storage_.create_if_absent(path), CreateStatus::AlreadyExists);
}

TEST_F(LocalStorageTest, CreateOverDirectoryReportsExisting) {
    fs::create_directories(dir_ + "/taken");
    // EEXIST from O_EXCL: an entry is already there
    EXPECT_EQ(storage_.create_if_absent(dir_ + "/taken"), CreateStatus::AlreadyExists);
}

TEST(MemoryStorageTest, DirectoriesAreIsolated) {
    MemoryStorage storage;
    storage.reset_directory("/base/a");
    storage.reset_directory("/base/a_x");
    storage.create_if_absent("/base/a/t1.inflight");
    storage.create_if_absent("/base/a_x/t2.inflight");

    EXPECT_EQ(storage.list_entries("/base/a"), (std::vector<std::string>{"t1.inflight"}));
    EXPECT_EQ(storage.list_entries("/base/a_x"), (std::vector<std::string>{"t2.inflight"}));

    storage.reset_directory("/base/a");
    EXPECT_TRUE(storage.list_entries("/base/a").empty());
    EXPECT_EQ(storage.size(), 1u);
}

TEST(MemoryStorageTest, ResetRemovesNestedDirectories) {
    MemoryStorage storage;
    storage.create_if_absent("/base/a/sub/f");
    storage.reset_directory("/base/a");
    EXPECT_FALSE(storage.exists("/base/a/sub"));
    EXPECT_FALSE(storage.exists("/base/a/sub/f"));
    EXPECT_TRUE(storage.exists("/base/a"));
}

TEST(MemoryStorageTest, CreateOverDirectoryThrows) {
    MemoryStorage storage;
    storage.reset_directory("/base/a");
    EXPECT_THROW(storage.create_if_absent("/base/a"), PersistenceError);
}
