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

#include <parklot/SessionService.hpp>
#include <parklot/errors.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace parklot {

namespace {
//==============================================================================
std::string spot_prefix(const CapacityClass capacity)
{
  switch (capacity)
  {
    case CapacityClass::SmallOnly:
      return "M";
    case CapacityClass::MediumCapable:
      return "C";
    case CapacityClass::LargeCapable:
      return "L";
  }

  return "X";
}

//==============================================================================
std::string make_spot_id(const CapacityClass capacity, const std::size_t number)
{
  std::stringstream ss;
  ss << spot_prefix(capacity) << std::setw(3) << std::setfill('0') << number;
  return ss.str();
}

//==============================================================================
std::vector<Session> copy(const std::vector<const Session*>& sessions)
{
  std::vector<Session> output;
  output.reserve(sessions.size());
  for (const Session* s : sessions)
    output.push_back(*s);

  return output;
}
} // anonymous namespace

//==============================================================================
class SessionService::Implementation
{
public:

  Implementation(
    SpotStorePtr store_,
    SpotAllocatorPtr allocator_,
    ConstFeeCalculatorPtr fees_,
    Clock clock_,
    SessionJournalPtr journal_)
  : store(std::move(store_)),
    allocator(std::move(allocator_)),
    fees(std::move(fees_)),
    clock(std::move(clock_)),
    journal(std::move(journal_))
  {
    if (!store || !allocator || !fees)
    {
      throw std::invalid_argument(
        "[parklot::SessionService] The store, allocator and fee calculator "
        "must not be nullptr");
    }

    if (!clock)
    {
      throw std::invalid_argument(
        "[parklot::SessionService] An empty clock was given");
    }
  }

  //============================================================================
  void initialize(
    const std::size_t floor_count,
    const SpotsPerFloor& spots_per_floor)
  {
    const std::lock_guard<std::mutex> lock(mutex);
    if (initialized)
    {
      throw std::runtime_error(
        "[parklot::SessionService::initialize] The lot was already "
        "initialized");
    }

    // Nothing that initialize() adds survives a failure
    Changes changes;
    try
    {
      build_spots(floor_count, spots_per_floor, changes);
      restore(changes);
    }
    catch (const std::exception&)
    {
      roll_back(changes);
      throw;
    }

    initialized = true;
  }

  //============================================================================
  std::optional<Session> check_in(const Vehicle& vehicle)
  {
    const std::lock_guard<std::mutex> lock(mutex);

    if (const Session* existing =
      store->active_session_for_vehicle(vehicle.plate()))
    {
      throw already_parked_error(vehicle.plate(), existing->spot_id());
    }

    const auto spot = allocator->allocate(vehicle.size(), vehicle.plate());
    if (!spot)
      return std::nullopt;

    Session session(next_ticket, vehicle, spot->id(), clock());
    if (!store->add_session(session))
    {
      allocator->release(spot->id());
      throw std::runtime_error(
        "[parklot::SessionService::check_in] Ticket ["
        + std::to_string(next_ticket) + "] already exists in the store");
    }

    ++next_ticket;
    record(session);
    return session;
  }

  //============================================================================
  Session check_out(const std::string& vehicle_id)
  {
    const std::lock_guard<std::mutex> lock(mutex);

    Session* session = store->active_session_for_vehicle(vehicle_id);
    if (!session)
      throw no_active_session_error(vehicle_id);

    if (!session->active())
      throw already_completed_error(session->ticket_id());

    // Everything that can fail happens before the session is completed, so a
    // failed check-out leaves the session and the spot untouched.
    const Time now = clock();
    const double hours = time::to_hours(session->duration(now));
    const double fee = fees->compute_fee(session->vehicle().size(), hours);
    allocator->release(session->spot_id());

    session->complete(now, fee);
    store->complete_session(session->ticket_id());
    record(*session);
    return *session;
  }

  //============================================================================
  std::vector<Session> active_sessions() const
  {
    const std::lock_guard<std::mutex> lock(mutex);
    return copy(store->active_sessions());
  }

  //============================================================================
  std::vector<Session> sessions() const
  {
    const std::lock_guard<std::mutex> lock(mutex);
    return copy(store->sessions());
  }

  //============================================================================
  std::optional<Session> get_session(const TicketId ticket_id) const
  {
    const std::lock_guard<std::mutex> lock(mutex);
    if (const Session* session = store->session(ticket_id))
      return *session;

    return std::nullopt;
  }

  SpotStorePtr store;
  SpotAllocatorPtr allocator;
  ConstFeeCalculatorPtr fees;

private:

  /// What initialize() has added to the store so far
  struct Changes
  {
    std::vector<std::string> spots;
    std::vector<TicketId> sessions;
  };

  //============================================================================
  void build_spots(
    const std::size_t floor_count,
    const SpotsPerFloor& spots_per_floor,
    Changes& changes)
  {
    for (std::size_t floor = 1; floor <= floor_count; ++floor)
    {
      for (const auto capacity : AllCapacityClasses)
      {
        const auto it = spots_per_floor.find(capacity);
        const std::size_t count = it == spots_per_floor.end() ? 0 : it->second;
        for (std::size_t i = 0; i < count; ++i)
        {
          const std::string id =
            make_spot_id(capacity, ++spot_counters[capacity]);

          if (!store->add_spot(Spot(id, floor, capacity)))
          {
            throw std::runtime_error(
              "[parklot::SessionService::initialize] The store already has a "
              "spot named [" + id + "]");
          }

          changes.spots.push_back(id);
        }
      }
    }
  }

  //============================================================================
  void roll_back(const Changes& changes)
  {
    for (const TicketId id : changes.sessions)
    {
      const Session* session = store->session(id);
      if (session && session->active())
      {
        const Spot* spot = store->spot(session->spot_id());
        if (spot && !spot->available())
          allocator->release(session->spot_id());
      }

      store->remove_session(id);
    }

    for (const auto& id : changes.spots)
      store->remove_spot(id);

    spot_counters.clear();
    next_ticket = 1;
  }

  //============================================================================
  void record(const Session& session)
  {
    if (!journal)
      return;

    try
    {
      journal->write(session);
    }
    catch (const std::exception& e)
    {
      std::cerr << "[parklot::SessionService] Failed to record ticket ["
                << session.ticket_id() << "] in the journal: " << e.what()
                << std::endl;
    }
  }

  //============================================================================
  const std::vector<Session>& journal_records()
  {
    // The journal is read once, so a retried initialize() replays the same
    // records.
    if (!recorded)
    {
      std::vector<Session> records;
      while (auto snapshot = journal->read_next())
        records.push_back(std::move(*snapshot));

      recorded = std::move(records);
    }

    return *recorded;
  }

  //============================================================================
  void restore(Changes& changes)
  {
    if (!journal)
      return;

    for (const Session& snapshot : journal_records())
    {
      const TicketId id = snapshot.ticket_id();
      try
      {
        if (snapshot.active())
          restore_check_in(snapshot, changes);
        else
          restore_check_out(snapshot, changes);
      }
      catch (const parking_error& e)
      {
        throw std::runtime_error(
          "[parklot::SessionService::initialize] Journal record for ticket ["
          + std::to_string(id) + "] does not match the lot: " + e.what());
      }

      next_ticket = std::max(next_ticket, id + 1);
    }
  }

  //============================================================================
  const Spot& require_spot(const Session& snapshot) const
  {
    const Spot* spot = store->spot(snapshot.spot_id());
    if (!spot)
    {
      throw spot_not_found_error(
        "SessionService::initialize", snapshot.spot_id());
    }

    return *spot;
  }

  //============================================================================
  void restore_check_in(const Session& snapshot, Changes& changes)
  {
    const std::string& plate = snapshot.vehicle().plate();
    if (const Session* existing = store->active_session_for_vehicle(plate))
      throw already_parked_error(plate, existing->spot_id());

    if (store->session(snapshot.ticket_id()))
    {
      throw std::runtime_error(
        "[parklot::SessionService::initialize] Journal opens ticket ["
        + std::to_string(snapshot.ticket_id()) + "] more than once");
    }

    const Spot& spot = require_spot(snapshot);
    if (!spot.fits(snapshot.vehicle().size()))
    {
      throw spot_conflict_error(
        spot.id(), "is " + to_string(spot.capacity()) + " and cannot hold the "
        + to_string(snapshot.vehicle().size()) + " vehicle [" + plate + "]");
    }

    allocator->occupy(snapshot.spot_id(), plate);
    store->add_session(snapshot);
    changes.sessions.push_back(snapshot.ticket_id());
  }

  //============================================================================
  void restore_check_out(const Session& snapshot, Changes& changes)
  {
    Session* existing = store->session(snapshot.ticket_id());
    if (!existing)
    {
      // The check-in was not recorded, so only the audit trail needs this.
      require_spot(snapshot);
      store->add_session(snapshot);
      changes.sessions.push_back(snapshot.ticket_id());
      return;
    }

    if (existing->vehicle().plate() != snapshot.vehicle().plate()
      || existing->spot_id() != snapshot.spot_id())
    {
      throw std::runtime_error(
        "[parklot::SessionService::initialize] Journal closes ticket ["
        + std::to_string(snapshot.ticket_id()) + "] for vehicle ["
        + snapshot.vehicle().plate() + "] in spot [" + snapshot.spot_id()
        + "], but it was opened for vehicle [" + existing->vehicle().plate()
        + "] in spot [" + existing->spot_id() + "]");
    }

    if (!existing->active())
      throw already_completed_error(existing->ticket_id());

    allocator->release(existing->spot_id());
    existing->complete(*snapshot.exit_time(), *snapshot.fee());
    store->complete_session(existing->ticket_id());
  }

  Clock clock;
  SessionJournalPtr journal;

  std::optional<std::vector<Session>> recorded;
  bool initialized = false;
  TicketId next_ticket = 1;
  std::unordered_map<CapacityClass, std::size_t> spot_counters;
  mutable std::mutex mutex;
};

//==============================================================================
SessionService::SessionService(
  SpotStorePtr store,
  SpotAllocatorPtr allocator,
  ConstFeeCalculatorPtr fee_calculator,
  Clock clock,
  SessionJournalPtr journal)
: _pimpl(utils::make_unique_impl<Implementation>(
      std::move(store),
      std::move(allocator),
      std::move(fee_calculator),
      std::move(clock),
      std::move(journal)))
{
  // Do nothing
}

//==============================================================================
void SessionService::initialize(
  const std::size_t floor_count,
  const SpotsPerFloor& spots_per_floor)
{
  _pimpl->initialize(floor_count, spots_per_floor);
}

//==============================================================================
std::optional<Session> SessionService::check_in(const Vehicle& vehicle)
{
  return _pimpl->check_in(vehicle);
}

//==============================================================================
Session SessionService::check_out(const std::string& vehicle_id)
{
  return _pimpl->check_out(vehicle_id);
}

//==============================================================================
auto SessionService::availability() const -> std::vector<Availability>
{
  // Snapshot-consistent through the allocator lock. The session lock is not
  // needed here.
  return _pimpl->allocator->availability();
}

//==============================================================================
bool SessionService::has_capacity(const VehicleSize size) const
{
  return _pimpl->allocator->has_capacity(size);
}

//==============================================================================
std::vector<Session> SessionService::active_sessions() const
{
  return _pimpl->active_sessions();
}

//==============================================================================
std::vector<Session> SessionService::sessions() const
{
  return _pimpl->sessions();
}

//==============================================================================
std::optional<Session> SessionService::get_session(
  const TicketId ticket_id) const
{
  return _pimpl->get_session(ticket_id);
}

} // namespace parklot
