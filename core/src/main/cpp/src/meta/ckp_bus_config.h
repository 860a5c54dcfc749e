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
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace ckpbus {
namespace meta {

/**
 * Runtime configuration for one checkpoint bus
 */
struct CkpBusConfig {
    static constexpr size_t kDefaultMaxRetainedInstants = 3;

    // Table/pipeline base location
    std::string base_path;

    // Bus directory relative to base_path (auxiliary folder of the table)
    std::string meta_dir = ".hoodie/.aux/ckp_meta";

    // Optional suffix so several writers can share one base location
    std::string unique_id;

    // 1 is enough to find the latest pending instant; a few more help debugging
    size_t max_retained_instants = kDefaultMaxRetainedInstants;

    /**
     * Create config with defaults, optionally reading from environment.
     * Throws std::invalid_argument on a malformed or non-positive retention limit.
     */
    static CkpBusConfig defaults(const std::string& base_path) {
        CkpBusConfig cfg;
        cfg.base_path = base_path;

        if (const char* env = std::getenv("CKPBUS_UNIQUE_ID")) {
            cfg.unique_id = env;
        }

        if (const char* env = std::getenv("CKPBUS_MAX_RETAINED_INSTANTS")) {
            long long n = std::stoll(env);
            if (n < 1) {
                throw std::invalid_argument(
                    std::string("CKPBUS_MAX_RETAINED_INSTANTS must be at least 1, got ") + env);
            }
            cfg.max_retained_instants = static_cast<size_t>(n);
        }

        return cfg;
    }

    /**
     * Same config with a fresh random unique_id
     */
    CkpBusConfig with_random_unique_id() const {
        CkpBusConfig cfg = *this;
        boost::uuids::random_generator gen;
        cfg.unique_id = boost::uuids::to_string(gen());
        return cfg;
    }

    /**
     * <base_path>/<meta_dir>[_<unique_id>]
     */
    std::string ckp_meta_path() const {
        std::string path = base_path;
        if (!path.empty() && path.back() != '/') {
            path += '/';
        }
        path += meta_dir;
        if (!unique_id.empty()) {
            path += "_" + unique_id;
        }
        return path;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (base_path.empty() || meta_dir.empty()) {
            return false;
        }
        if (max_retained_instants < 1) {
            // Must keep at least the latest instant
            return false;
        }
        if (unique_id.find('/') != std::string::npos) {
            return false;
        }
        return true;
    }
};

} // namespace meta
} // namespace ckpbus
