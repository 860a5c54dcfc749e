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

/*
 * Example: one coordinator driving checkpoints, several workers polling
 *
 * Usage: ckp_bus_usage [base_path] [workers] [checkpoints]
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "../src/meta/ckp_bus.h"
#include "../src/persistence/local_storage.h"
#include "../src/persistence/persistence_error.h"
#include "../src/util/log_runtime.h"

using namespace ckpbus;
using namespace std;

static string instant_name(int i) {
    char buf[32];
    snprintf(buf, sizeof(buf), "2026%010d", i);
    return buf;
}

int main(int argc, char** argv) {
    string base = argc > 1 ? argv[1]
                           : (filesystem::temp_directory_path() / "ckpbus_example").string();
    int workers = argc > 2 ? atoi(argv[2]) : 3;
    int checkpoints = argc > 3 ? atoi(argv[3]) : 10;

    LogRuntime runtime(LogRuntime::Config::fromEnv());

    persist::LocalStorage storage;
    meta::CkpBusConfig config = meta::CkpBusConfig::defaults(base);

    cout << "=== Checkpoint bus example ===\n";
    cout << "Bus directory: " << config.ckp_meta_path() << "\n";
    cout << "Workers: " << workers << ", checkpoints: " << checkpoints << "\n\n";

    try {
        meta::CkpBus coordinator(storage, config);
        coordinator.set_cleanup_callback([](const meta::CleanupWarning& w) {
            cout << "  cleanup of " << w.instant << " failed: " << w.message << "\n";
        });
        coordinator.bootstrap();

        atomic<bool> done{false};
        atomic<int> last_seen{-1};
        vector<thread> pool;

        // Workers: report the pending instant they would write under
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back([&, w]() {
                meta::CkpBus bus(storage, config);
                string previous;
                while (!done.load()) {
                    try {
                        auto pending = bus.last_pending_instant();
                        if (pending && *pending != previous) {
                            previous = *pending;
                            info() << "worker " << w << " writing under " << previous
                                   << (bus.is_aborted(previous) ? " (retry)" : "");
                        }
                    } catch (const persist::PersistenceError& e) {
                        warning() << "worker " << w << " poll failed: " << e.what();
                    }
                    this_thread::sleep_for(chrono::milliseconds(2));
                }
            });
        }

        auto start = chrono::steady_clock::now();
        for (int i = 0; i < checkpoints; ++i) {
            string instant = instant_name(i);
            coordinator.start_instant(instant);
            this_thread::sleep_for(chrono::milliseconds(10));

            // Every fourth checkpoint fails once and is retried under the same id
            if (i % 4 == 3) {
                coordinator.abort_instant(instant);
                this_thread::sleep_for(chrono::milliseconds(5));
                coordinator.start_instant(instant);
                this_thread::sleep_for(chrono::milliseconds(5));
            }
            coordinator.commit_instant(instant);
            last_seen = i;
        }

        done = true;
        for (auto& t : pool) t.join();

        auto ms = chrono::duration_cast<chrono::milliseconds>(
            chrono::steady_clock::now() - start).count();

        cout << "Drove " << (last_seen + 1) << " checkpoints in " << ms << " ms\n\n";

        cout << "Resolved view:\n";
        for (const auto& msg : coordinator.get_messages()) {
            cout << "  " << msg << "\n";
        }

        auto stats = coordinator.stats();
        cout << "\nCoordinator stats:\n";
        cout << "  Markers written:   " << stats.markers_written << "\n";
        cout << "  Directory scans:   " << stats.scans << "\n";
        cout << "  Instants cleaned:  " << stats.instants_cleaned << "\n";
        cout << "  Cleanup failures:  " << stats.cleanup_failures << "\n";
        cout << "  Retained instants: " << coordinator.instant_cache().size() << "\n";
    } catch (const exception& e) {
        cerr << "example failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
