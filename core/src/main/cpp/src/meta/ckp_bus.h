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
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ckp_bus_config.h"
#include "ckp_errors.h"
#include "ckp_message.h"
#include "ckp_message_store.h"
#include "instant_retention.h"
#include "../persistence/storage_adapter.h"

namespace ckpbus::meta {

/**
 * Checkpoint message bus over a shared durable directory.
 *
 * The coordinator bootstraps the directory and writes one marker per instant
 * state change (start, commit, abort). Workers each hold their own bus on the
 * same directory and poll it: every read lists the directory afresh and
 * resolves each instant to its highest ranked state.
 *
 * Signals travel out of band of the engine's task mailbox: a writer blocked
 * waiting on a mailbox event would hold up the very queue that event is
 * waiting in.
 *
 * Not internally synchronized. Mutating calls come from one thread of the
 * coordinator; readers use separate instances.
 */
class CkpBus {
public:
  struct Stats {
    uint64_t markers_written = 0;
    uint64_t scans = 0;
    uint64_t instants_cleaned = 0;
    uint64_t cleanup_failures = 0;
  };

  using CleanupCallback = std::function<void(const CleanupWarning& warning)>;

  // Throws std::invalid_argument if config.validate() fails
  CkpBus(persist::StorageAdapter& storage, const CkpBusConfig& config);

  // Drops the in-memory cache; durable state is left alone
  ~CkpBus();

  CkpBus(const CkpBus&) = delete;
  CkpBus& operator=(const CkpBus&) = delete;

  // ---------------------------------------------------------------------
  //  Coordinator
  // ---------------------------------------------------------------------

  /**
   * Wipe the bus directory and recreate it empty.
   *
   * Destroys the coordination state of every worker: call once, from the
   * coordinator, at pipeline start.
   */
  void bootstrap();

  /**
   * Publish an INFLIGHT marker, track the instant and run retention.
   * The marker is durable before retention runs.
   * Throws PersistenceError if the marker cannot be written.
   */
  void start_instant(const std::string& instant);

  // Publish a COMPLETED marker. The instant need not have been started.
  void commit_instant(const std::string& instant);

  // Publish an ABORTED marker. The instant need not have been started.
  void abort_instant(const std::string& instant);

  // ---------------------------------------------------------------------
  //  Worker
  // ---------------------------------------------------------------------

  /**
   * The most recent instant if it is still pending (INFLIGHT or ABORTED;
   * an aborted instant may be retried under the same id), nullopt if the
   * most recent instant completed or there is none. Always rescans.
   */
  std::optional<std::string> last_pending_instant();

  // Resolved view sorted by instant id. Always rescans.
  const std::vector<CkpMessage>& get_messages();

  /**
   * Whether the instant resolved to ABORTED in the last loaded view.
   * Throws PreconditionViolation if no view was loaded yet.
   */
  bool is_aborted(const std::string& instant) const;

  // ---------------------------------------------------------------------
  //  Lifecycle / diagnostics
  // ---------------------------------------------------------------------

  // Drop the known-instants cache. Idempotent.
  void close();

  const std::string& path() const { return store_.path(); }
  const CkpBusConfig& config() const { return config_; }
  const std::deque<std::string>& instant_cache() const { return retention_.instants(); }
  Stats stats() const { return stats_; }

  void set_cleanup_callback(CleanupCallback cb) { cleanup_callback_ = std::move(cb); }

private:
  void publish(const std::string& instant, CkpState state, const char* what);
  void load();
  void clean();

  CkpBusConfig config_;
  CkpMessageStore store_;
  InstantRetention retention_;

  std::optional<std::vector<CkpMessage>> messages_;  // last resolved view
  Stats stats_;
  CleanupCallback cleanup_callback_;
};

} // namespace ckpbus::meta
