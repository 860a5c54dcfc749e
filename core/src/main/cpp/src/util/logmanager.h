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

#include "log.h"
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>

namespace ckpbus {

    /**
     * Owns the log file. While a LogManager is alive every Logger flush goes
     * to <log_dir>/ckpbus.log instead of stderr.
     *
     * Rotation renames ckpbus.log -> ckpbus.log.1 -> ... -> ckpbus.log.<max_files>
     * and drops anything older.
     */
    class LogManager {
    public:
        struct RotationConfig {
            size_t max_file_size;                  // rotate when the file grows past this
            size_t max_files;                      // rotated files to keep
            bool enable_auto_rotation;             // background size check
            std::chrono::milliseconds check_interval;

            RotationConfig()
                : max_file_size(64 * 1024 * 1024)
                , max_files(5)
                , enable_auto_rotation(true)
                , check_interval(1000) {}
        };

        explicit LogManager(const std::string& log_dir,
                            const RotationConfig& config = RotationConfig());
        ~LogManager();

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        // Rotate now regardless of size
        void rotate();

        // Rotate if the active file is over max_file_size; returns true if rotated
        bool rotateIfNeeded();

        const std::string& getLogPath() const { return _path; }

    private:
        void open(bool append);
        void rotationLoop();

        RotationConfig _config;
        std::string _path;
        FILE* _file;
        std::mutex _mutex;

        std::thread _rotationThread;
        std::mutex _stopMutex;
        std::condition_variable _stopCv;
        bool _stop;
    };

}
