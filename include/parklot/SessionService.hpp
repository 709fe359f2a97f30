/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#ifndef PARKLOT__SESSIONSERVICE_HPP
#define PARKLOT__SESSIONSERVICE_HPP

#include <parklot/FeeCalculator.hpp>
#include <parklot/Session.hpp>
#include <parklot/SessionJournal.hpp>
#include <parklot/SpotAllocator.hpp>
#include <parklot/SpotStore.hpp>
#include <parklot/Time.hpp>
#include <parklot/Vehicle.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parklot {

//==============================================================================
/// Checks vehicles in and out of the lot.
///
/// check_in() and check_out() are serialized by a session lock that is held
/// for the full duration of each call. While holding it, they call into the
/// SpotAllocator, which takes its own lock. The order is always session lock
/// first, allocator lock second.
///
/// Ticket identifiers and spot identifiers are generated by counters that
/// belong to this instance, so several lots can coexist in one process.
class SessionService
{
public:

  using Availability = SpotAllocator::Availability;

  /// Constructor
  ///
  /// \param[in] store
  ///   The store that holds the spots and sessions of the lot.
  ///
  /// \param[in] allocator
  ///   The allocator for the spots of the same store.
  ///
  /// \param[in] fee_calculator
  ///   The rate table used at check-out.
  ///
  /// \param[in] clock
  ///   The source of the current time for entry and exit timestamps.
  ///
  /// \param[in] journal
  ///   Optional durable record of session transitions. If one is given, it is
  ///   replayed by initialize() and then appended to after every check-in and
  ///   check-out. A write that throws is reported on std::cerr and does not
  ///   undo the check-in or check-out that it records.
  ///
  /// \throws std::invalid_argument if store, allocator or fee_calculator is a
  /// nullptr, or if clock is empty.
  SessionService(
    SpotStorePtr store,
    SpotAllocatorPtr allocator,
    ConstFeeCalculatorPtr fee_calculator,
    Clock clock = time::system_clock(),
    SessionJournalPtr journal = nullptr);

  /// Build the spots of the lot, then restore sessions from the journal if
  /// one was provided.
  ///
  /// Every floor from 1 to floor_count receives the given number of spots of
  /// each capacity class. Spot identifiers are a class prefix ("M" for
  /// small_only, "C" for medium_capable, "L" for large_capable) followed by a
  /// per-class running number, e.g. "C001", "C002", ...
  ///
  /// This is a one-time setup step that must finish before any concurrent
  /// check-ins or check-outs begin. If it throws, the spots and sessions that
  /// it added are removed again and it may be called again. The journal is
  /// only read by the first call; later calls replay the same records.
  ///
  /// \throws std::runtime_error if the lot was already initialized, if a spot
  /// identifier collides with a spot that is already in the store, or if the
  /// journal does not match the lot. A journal does not match the lot if a
  /// record names a spot that does not exist, puts a vehicle in a spot that
  /// cannot hold it or in an occupied spot, parks a vehicle twice, or closes a
  /// ticket for a different vehicle or spot than the one that opened it.
  void initialize(
    std::size_t floor_count,
    const SpotsPerFloor& spots_per_floor);

  /// Check a vehicle into the lot.
  ///
  /// \return the new active session, or std::nullopt if no compatible spot is
  /// available. Running out of spots is not an error.
  ///
  /// \throws already_parked_error if the vehicle already has an active session.
  /// No spot is allocated in that case.
  std::optional<Session> check_in(const Vehicle& vehicle);

  /// Check a vehicle out of the lot, charge it, and free its spot.
  ///
  /// \return the completed session.
  ///
  /// \throws no_active_session_error if the vehicle has no active session.
  ///
  /// \throws unknown_vehicle_class_error if the rate table has no rate for the
  /// vehicle. The session stays active and the spot stays occupied.
  Session check_out(const std::string& vehicle_id);

  /// Get a point-in-time availability report. See SpotAllocator::availability()
  std::vector<Availability> availability() const;

  /// True if a vehicle of the given size could be parked right now. The answer
  /// may be stale by the time the caller acts on it; check_in() is the
  /// authoritative test.
  bool has_capacity(VehicleSize size) const;

  /// Get every active session, ordered by ticket identifier.
  std::vector<Session> active_sessions() const;

  /// Get every session that the lot has recorded, including completed ones,
  /// ordered by ticket identifier.
  std::vector<Session> sessions() const;

  /// Get a session by its ticket identifier.
  std::optional<Session> get_session(TicketId ticket_id) const;

  class Implementation;
private:
  utils::unique_impl_ptr<Implementation> _pimpl;
};

using SessionServicePtr = std::shared_ptr<SessionService>;

} // namespace parklot

#endif // PARKLOT__SESSIONSERVICE_HPP
