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
#include <atomic>
#include <cstdio>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include "test_helpers.h"
#include "../../src/meta/ckp_bus.h"
#include "../../src/persistence/local_storage.h"

using namespace ckpbus;
using namespace ckpbus::meta;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class CkpBusLocalTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir_ = test::create_temp_dir("ckpbus_local_test");
        cfg_.base_path = base_dir_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_dir_, ec);
    }

    std::string base_dir_;
    CkpBusConfig cfg_;
    persist::LocalStorage storage_;
};

TEST_F(CkpBusLocalTest, MarkersAreEmptyFilesNamedByCodec) {
    CkpBus bus(storage_, cfg_);
    bus.bootstrap();
    ASSERT_TRUE(fs::is_directory(bus.path()));

    bus.start_instant("20240101000000");
    bus.commit_instant("20240101000000");

    fs::path inflight = fs::path(bus.path()) / "20240101000000.inflight";
    fs::path completed = fs::path(bus.path()) / "20240101000000.completed";
    ASSERT_TRUE(fs::exists(inflight));
    ASSERT_TRUE(fs::exists(completed));
    EXPECT_EQ(fs::file_size(inflight), 0u);
    EXPECT_EQ(fs::file_size(completed), 0u);
}

TEST_F(CkpBusLocalTest, BootstrapRemovesEverythingUnderTheBusDirectory) {
    CkpBus bus(storage_, cfg_);
    bus.bootstrap();
    bus.start_instant("t1");
    std::ofstream(fs::path(bus.path()) / "debug.txt") << "left behind";

    bus.bootstrap();
    EXPECT_TRUE(fs::is_directory(bus.path()));
    EXPECT_TRUE(fs::is_empty(bus.path()));
    EXPECT_TRUE(bus.get_messages().empty());
}

TEST_F(CkpBusLocalTest, StrayFilesAreIgnored) {
    CkpBus bus(storage_, cfg_);
    bus.bootstrap();
    bus.start_instant("t1");
    std::ofstream(fs::path(bus.path()) / "notes.md") << "x";
    std::ofstream(fs::path(bus.path()) / ".t1.inflight.crc") << "x";
    fs::create_directories(fs::path(bus.path()) / "nested");

    const auto& view = bus.get_messages();
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view[0], CkpMessage("t1", CkpState::Inflight));
}

TEST_F(CkpBusLocalTest, MarkerNamedDirectoryIsIgnored) {
    CkpBus bus(storage_, cfg_);
    bus.bootstrap();
    bus.start_instant("t1");
    bus.commit_instant("t1");
    fs::create_directories(fs::path(bus.path()) / "t9.inflight");

    EXPECT_FALSE(bus.last_pending_instant().has_value());
    const auto& view = bus.get_messages();
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view[0], CkpMessage("t1", CkpState::Completed));
}

TEST_F(CkpBusLocalTest, WorkerBeforeBootstrapSeesNoMessages) {
    CkpBus worker(storage_, cfg_);
    EXPECT_FALSE(fs::exists(worker.path()));
    EXPECT_TRUE(worker.get_messages().empty());
    EXPECT_FALSE(worker.last_pending_instant().has_value());
}

TEST_F(CkpBusLocalTest, StartWithoutBootstrapCreatesDirectory) {
    CkpBus bus(storage_, cfg_);
    bus.start_instant("t1");
    EXPECT_TRUE(fs::exists(fs::path(bus.path()) / "t1.inflight"));
}

TEST_F(CkpBusLocalTest, RetentionDeletesFiles) {
    cfg_.max_retained_instants = 3;
    CkpBus bus(storage_, cfg_);
    bus.bootstrap();
    for (const char* t : {"t1", "t2", "t3", "t4", "t5"}) {
        bus.start_instant(t);
        bus.commit_instant(t);
    }

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(bus.path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 6u);  // inflight + completed for t3..t5
    EXPECT_FALSE(fs::exists(fs::path(bus.path()) / "t1.completed"));
    EXPECT_FALSE(fs::exists(fs::path(bus.path()) / "t2.inflight"));
}

TEST_F(CkpBusLocalTest, SurvivesCoordinatorRestart) {
    {
        CkpBus coordinator(storage_, cfg_);
        coordinator.bootstrap();
        coordinator.start_instant("t1");
        coordinator.abort_instant("t1");
    }
    persist::LocalStorage other_process_storage;
    CkpBus worker(other_process_storage, cfg_);
    EXPECT_EQ(worker.last_pending_instant(), std::optional<std::string>("t1"));
    EXPECT_TRUE(worker.is_aborted("t1"));
}

TEST_F(CkpBusLocalTest, WorkersPollWhileCoordinatorAdvances) {
    const int kInstants = 20;
    const int kWorkers = 4;

    CkpBus coordinator(storage_, cfg_);
    coordinator.bootstrap();

    std::atomic<bool> done{false};
    std::atomic<int> read_errors{0};
    std::vector<std::thread> workers;
    std::vector<std::string> last_seen(kWorkers);

    for (int w = 0; w < kWorkers; ++w) {
        workers.emplace_back([&, w]() {
            persist::LocalStorage worker_storage;
            CkpBus worker(worker_storage, cfg_);
            while (!done.load()) {
                try {
                    const auto& view = worker.get_messages();
                    for (size_t i = 1; i < view.size(); ++i) {
                        if (!(view[i - 1].instant() < view[i].instant())) {
                            read_errors.fetch_add(1);
                        }
                    }
                    if (auto pending = worker.last_pending_instant()) {
                        last_seen[w] = *pending;
                    }
                } catch (const std::exception&) {
                    read_errors.fetch_add(1);
                }
                std::this_thread::sleep_for(1ms);
            }
        });
    }

    char buf[16];
    for (int i = 0; i < kInstants; ++i) {
        std::snprintf(buf, sizeof(buf), "t%04d", i);
        coordinator.start_instant(buf);
        std::this_thread::sleep_for(2ms);
        if (i + 1 < kInstants) {
            coordinator.commit_instant(buf);
        }
    }

    // Give every worker time to observe the final pending instant
    std::this_thread::sleep_for(50ms);
    done.store(true);
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(read_errors.load(), 0);
    for (int w = 0; w < kWorkers; ++w) {
        EXPECT_EQ(last_seen[w], "t0019") << "worker " << w;
    }
    EXPECT_LE(coordinator.get_messages().size(), cfg_.max_retained_instants);
}
