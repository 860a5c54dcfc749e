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

#include "ckp_bus.h"
#include "ckp_reducer.h"
#include "../persistence/persistence_error.h"
#include "../util/log.h"
#include <algorithm>
#include <stdexcept>

namespace ckpbus::meta {

namespace {

const CkpBusConfig& validated(const CkpBusConfig& config) {
  if (!config.validate()) {
    throw std::invalid_argument("Invalid checkpoint bus configuration for base path '" +
                                config.base_path + "'");
  }
  return config;
}

} // namespace

CkpBus::CkpBus(persist::StorageAdapter& storage, const CkpBusConfig& config)
  : config_(validated(config)),
    store_(storage, config_.ckp_meta_path()),
    retention_(config_.max_retained_instants) {
}

CkpBus::~CkpBus() {
  close();
}

void CkpBus::close() {
  retention_.clear();
}

// -------------------------------------------------------------------------
//  WRITE METHODS
// -------------------------------------------------------------------------

void CkpBus::bootstrap() {
  try {
    store_.reset();
  } catch (const persist::PersistenceError& e) {
    error() << "Failed to bootstrap checkpoint metadata under " << store_.path() << ": " << e.what();
    throw;
  }
  info() << "Bootstrapped checkpoint metadata under " << store_.path();
}

void CkpBus::publish(const std::string& instant, CkpState state, const char* what) {
  CkpMessageCodec::validate_instant(instant);
  try {
    store_.append(instant, state);
  } catch (const persist::PersistenceError& e) {
    error() << "Exception while adding checkpoint " << what << " metadata for instant: "
            << instant << ": " << e.what();
    throw persist::PersistenceError(
        std::string("Exception while adding checkpoint ") + what + " metadata for instant " + instant,
        e.path(), e.error_code());
  }
  ++stats_.markers_written;
  debug() << "[CKP] " << what << " instant=" << instant << " state=" << state;
}

void CkpBus::start_instant(const std::string& instant) {
  publish(instant, CkpState::Inflight, "start");
  retention_.track(instant);
  clean();
}

void CkpBus::commit_instant(const std::string& instant) {
  publish(instant, CkpState::Completed, "commit");
}

void CkpBus::abort_instant(const std::string& instant) {
  publish(instant, CkpState::Aborted, "abort");
}

void CkpBus::clean() {
  auto result = retention_.clean(store_);
  stats_.instants_cleaned += result.cleaned;
  if (!result.failure) {
    return;
  }

  ++stats_.cleanup_failures;
  warning() << result.failure->message;
  if (cleanup_callback_) {
    try {
      cleanup_callback_(*result.failure);
    } catch (const std::exception& e) {
      warning() << "Checkpoint cleanup callback threw: " << e.what();
    }
  }
}

// -------------------------------------------------------------------------
//  READ METHODS
// -------------------------------------------------------------------------

void CkpBus::load() {
  std::vector<CkpMessage> raw;
  try {
    raw = store_.scan();
  } catch (const persist::PersistenceError& e) {
    error() << "Exception while scanning the checkpoint meta files under path: "
            << store_.path() << ": " << e.what();
    throw persist::PersistenceError(
        "Exception while scanning the checkpoint meta files", store_.path(), e.error_code());
  }
  ++stats_.scans;
  messages_ = reduce_messages(raw);
}

std::optional<std::string> CkpBus::last_pending_instant() {
  load();
  if (!messages_->empty()) {
    const CkpMessage& last = messages_->back();
    // 'aborted' counts as pending so the instant can be reused
    if (!last.is_complete()) {
      return last.instant();
    }
  }
  return std::nullopt;
}

const std::vector<CkpMessage>& CkpBus::get_messages() {
  load();
  return *messages_;
}

bool CkpBus::is_aborted(const std::string& instant) const {
  if (!messages_) {
    throw PreconditionViolation("The checkpoint metadata should be loaded first "
                                "(get_messages or last_pending_instant)");
  }
  return std::any_of(messages_->begin(), messages_->end(), [&instant](const CkpMessage& m) {
    return m.instant() == instant && m.is_aborted();
  });
}

} // namespace ckpbus::meta
