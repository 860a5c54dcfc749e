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

#include "logmanager.h"
#include <boost/filesystem/operations.hpp>
#include <stdexcept>

namespace ckpbus {

    namespace bfs = boost::filesystem;

    LogManager::LogManager(const std::string& log_dir, const RotationConfig& config)
        : _config(config), _file(nullptr), _stop(false) {
        bfs::path dir = log_dir.empty() ? bfs::current_path() : bfs::path(log_dir);

        boost::system::error_code ec;
        bfs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("can't create log directory [" + dir.string() + "]: " + ec.message());
        }
        if (!bfs::is_directory(dir)) {
            throw std::runtime_error("logpath [" + dir.string() + "] should be a directory");
        }

        _path = (dir / "ckpbus.log").string();
        open(true);

        if (_config.enable_auto_rotation) {
            _rotationThread = std::thread([this]() { rotationLoop(); });
        }
    }

    LogManager::~LogManager() {
        {
            std::lock_guard<std::mutex> lk(_stopMutex);
            _stop = true;
        }
        _stopCv.notify_all();
        if (_rotationThread.joinable()) {
            _rotationThread.join();
        }

        std::lock_guard<std::mutex> lk(_mutex);
        Logger::setLogFile(nullptr);  // after this point no thread will be using the file
        if (_file) {
            fclose(_file);
            _file = nullptr;
        }
    }

    void LogManager::open(bool append) {
        FILE* tmp = fopen(_path.c_str(), append ? "a" : "w");
        if (!tmp) {
            throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
        }
        Logger::setLogFile(tmp);
        if (_file) {
            fclose(_file);
        }
        _file = tmp;
    }

    void LogManager::rotate() {
        std::lock_guard<std::mutex> lk(_mutex);

        // Shift ckpbus.log.N-1 -> ckpbus.log.N, dropping the oldest
        boost::system::error_code ec;
        if (_config.max_files > 0) {
            bfs::remove(_path + "." + std::to_string(_config.max_files), ec);
            for (size_t i = _config.max_files; i > 1; --i) {
                bfs::path from(_path + "." + std::to_string(i - 1));
                if (bfs::exists(from, ec)) {
                    bfs::rename(from, _path + "." + std::to_string(i), ec);
                }
            }
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
                _file = nullptr;
            }
            bfs::rename(_path, _path + ".1", ec);
            if (ec) {
                std::cerr << "failed to rotate " << _path << ": " << ec.message() << std::endl;
            }
        }

        open(_config.max_files > 0);
    }

    bool LogManager::rotateIfNeeded() {
        boost::system::error_code ec;
        auto size = bfs::file_size(_path, ec);
        if (ec || size < _config.max_file_size) {
            return false;
        }
        rotate();
        return true;
    }

    void LogManager::rotationLoop() {
        std::unique_lock<std::mutex> lk(_stopMutex);
        while (!_stop) {
            _stopCv.wait_for(lk, _config.check_interval, [this]() { return _stop; });
            if (_stop) {
                break;
            }
            lk.unlock();
            try {
                rotateIfNeeded();
            } catch (const std::exception& e) {
                std::cerr << "log rotation failed: " << e.what() << std::endl;
            }
            lk.lock();
        }
    }
}
