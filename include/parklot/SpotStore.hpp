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

#ifndef PARKLOT__SPOTSTORE_HPP
#define PARKLOT__SPOTSTORE_HPP

#include <parklot/Session.hpp>
#include <parklot/Spot.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <memory>
#include <string>
#include <vector>

namespace parklot {

//==============================================================================
/// In-memory storage for the spots and sessions of one lot.
///
/// The store applies no policy and does no locking. Spot occupancy must only be
/// changed while holding the SpotAllocator lock, and sessions must only be
/// changed while holding the SessionService lock.
///
/// Pointers returned by the store remain valid for the lifetime of the store.
class SpotStore
{
public:

  /// Default constructor. The store begins empty.
  SpotStore();

  /// Add a spot.
  ///
  /// \return false if a spot with the same identifier already exists. The store
  /// is left unchanged in that case.
  bool add_spot(Spot spot);

  /// Remove a spot. Pointers to it become invalid.
  ///
  /// \return false if there is no spot with this identifier.
  bool remove_spot(const std::string& id);

  /// Get a spot by its identifier, or a nullptr if it does not exist.
  Spot* spot(const std::string& id);

  /// const-qualified spot()
  const Spot* spot(const std::string& id) const;

  /// Get every spot, ordered by identifier.
  std::vector<const Spot*> spots() const;

  /// Get every spot that is currently available, ordered by identifier.
  std::vector<Spot*> available_spots();

  /// Add a session. If the session is active, it also becomes the active
  /// session of its vehicle.
  ///
  /// \return false if a session with the same ticket identifier already exists.
  /// The store is left unchanged in that case.
  bool add_session(Session session);

  /// Remove a session, along with its vehicle index entry if it is the active
  /// session of its vehicle. Pointers to it become invalid.
  ///
  /// \return false if there is no session with this ticket identifier.
  bool remove_session(TicketId id);

  /// Get a session by its ticket identifier, or a nullptr if it does not exist.
  Session* session(TicketId id);

  /// const-qualified session()
  const Session* session(TicketId id) const;

  /// Get the active session of a vehicle, or a nullptr if it has none.
  Session* active_session_for_vehicle(const std::string& plate);

  /// const-qualified active_session_for_vehicle()
  const Session* active_session_for_vehicle(const std::string& plate) const;

  /// Remove a session from the index of active sessions. The session itself
  /// is retained. The caller is responsible for completing it.
  void complete_session(TicketId id);

  /// Get every session, ordered by ticket identifier.
  std::vector<const Session*> sessions() const;

  /// Get every active session, ordered by ticket identifier.
  std::vector<const Session*> active_sessions() const;

  class Implementation;
private:
  utils::unique_impl_ptr<Implementation> _pimpl;
};

using SpotStorePtr = std::shared_ptr<SpotStore>;

} // namespace parklot

#endif // PARKLOT__SPOTSTORE_HPP
