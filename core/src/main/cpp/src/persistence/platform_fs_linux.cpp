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

#include "platform_fs.h"

#ifdef CKPBUS_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <filesystem>

namespace ckpbus { 
    namespace persist {

        FSResult PlatformFS::create_exclusive(const std::string& path) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            if (::close(fd) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::remove_all(const std::string& path) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            if (ec) {
                return {false, ec.value()};
            }
            return {true, 0};
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec) {
                if (std::filesystem::is_directory(path)) {
                    // Raced with another creator
                    return {true, 0};
                }
                return {false, ec.value()};
            }
            return {true, 0};
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            // Open directory for reading
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }
            
            // Fsync the directory to ensure metadata changes are persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);
            
            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::list_directory(const std::string& dir_path,
                                            std::vector<std::string>* out) {
            DIR* dir = ::opendir(dir_path.c_str());
            if (!dir) {
                return {false, errno};
            }

            // readdir only reports errors through errno with a null return
            errno = 0;
            while (struct dirent* ent = ::readdir(dir)) {
                const char* name = ent->d_name;
                bool regular = ent->d_type == DT_REG;
                if (ent->d_type == DT_UNKNOWN) {
                    // Some filesystems leave d_type unset
                    struct stat st{};
                    regular = ::fstatat(::dirfd(dir), name, &st, AT_SYMLINK_NOFOLLOW) == 0 &&
                              S_ISREG(st.st_mode);
                }
                if (regular) {
                    out->emplace_back(name);
                }
                errno = 0;
            }
            int saved_errno = errno;
            ::closedir(dir);

            return {saved_errno == 0, saved_errno};
        }

        bool PlatformFS::exists(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0;
        }

        bool PlatformFS::is_directory(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
        }

    } // namespace persist
} // namespace ckpbus

#endif // CKPBUS_LINUX
