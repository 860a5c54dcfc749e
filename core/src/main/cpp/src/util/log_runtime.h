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
#include "logmanager.h"
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

namespace ckpbus {

/**
 * LogRuntime - owns the process logging setup
 *
 * Usage:
 *   - Tests: LogRuntimeGuard on the stack
 *   - Production: create at startup (usually via LogRuntime::Config::fromEnv()),
 *     destroy at shutdown
 */
class LogRuntime {
public:
    struct Config {
        // Logging output
        bool enable_file_logging;
        std::string log_dir;  // Empty = current directory

        // Rotation settings
        LogManager::RotationConfig rotation_config;

        // Initial log level
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , initial_level(LOG_WARNING) {}

        /**
         * Defaults overridden by CKPBUS_LOG_* variables and LOG_LEVEL
         */
        static Config fromEnv() {
            Config config;

            if (const char* enable = std::getenv("CKPBUS_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }

            if (const char* dir = std::getenv("CKPBUS_LOG_DIR")) {
                config.log_dir = dir;
            }

            if (const char* size = std::getenv("CKPBUS_LOG_MAX_SIZE_MB")) {
                config.rotation_config.max_file_size = std::stoull(size) * 1024 * 1024;
            }

            if (const char* files = std::getenv("CKPBUS_LOG_MAX_FILES")) {
                config.rotation_config.max_files = std::stoull(files);
            }

            if (const char* auto_rotate = std::getenv("CKPBUS_LOG_AUTO_ROTATE")) {
                config.rotation_config.enable_auto_rotation = (std::string(auto_rotate) != "0");
            }

            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);
        initLoggingFromEnv();

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(
                config_.log_dir,
                config_.rotation_config
            );
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Explicitly shutdown all logging components
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Destroy LogManager (joins rotation thread, closes file, resets to stderr)
        log_manager_.reset();
        Logger::setLogFile(nullptr);
    }

    LogManager* logManager() { return log_manager_.get(); }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: RAII guard for tests
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
        Logger::setLogFile(nullptr);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace ckpbus
