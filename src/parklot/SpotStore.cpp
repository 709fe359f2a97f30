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

#include <parklot/SpotStore.hpp>

#include <map>
#include <unordered_map>

namespace parklot {

//==============================================================================
class SpotStore::Implementation
{
public:

  // std::map keeps the spots ordered by identifier and never invalidates
  // references to its elements on insertion.
  std::map<std::string, Spot> spots;

  std::map<TicketId, Session> sessions;

  // Plate -> ticket of the active session for that vehicle
  std::unordered_map<std::string, TicketId> active_by_vehicle;

};

//==============================================================================
SpotStore::SpotStore()
: _pimpl(utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
bool SpotStore::add_spot(Spot spot)
{
  const std::string id = spot.id();
  return _pimpl->spots.insert({id, std::move(spot)}).second;
}

//==============================================================================
bool SpotStore::remove_spot(const std::string& id)
{
  return _pimpl->spots.erase(id) > 0;
}

//==============================================================================
Spot* SpotStore::spot(const std::string& id)
{
  const auto it = _pimpl->spots.find(id);
  if (it == _pimpl->spots.end())
    return nullptr;

  return &it->second;
}

//==============================================================================
const Spot* SpotStore::spot(const std::string& id) const
{
  return const_cast<SpotStore*>(this)->spot(id);
}

//==============================================================================
std::vector<const Spot*> SpotStore::spots() const
{
  std::vector<const Spot*> output;
  output.reserve(_pimpl->spots.size());
  for (const auto& element : _pimpl->spots)
    output.push_back(&element.second);

  return output;
}

//==============================================================================
std::vector<Spot*> SpotStore::available_spots()
{
  std::vector<Spot*> output;
  for (auto& element : _pimpl->spots)
  {
    if (element.second.available())
      output.push_back(&element.second);
  }

  return output;
}

//==============================================================================
bool SpotStore::add_session(Session session)
{
  const TicketId id = session.ticket_id();
  const bool active = session.active();
  const std::string plate = session.vehicle().plate();

  const auto inserted = _pimpl->sessions.insert({id, std::move(session)});
  if (!inserted.second)
    return false;

  if (active)
    _pimpl->active_by_vehicle[plate] = id;

  return true;
}

//==============================================================================
bool SpotStore::remove_session(const TicketId id)
{
  if (!session(id))
    return false;

  complete_session(id);
  _pimpl->sessions.erase(id);
  return true;
}

//==============================================================================
Session* SpotStore::session(const TicketId id)
{
  const auto it = _pimpl->sessions.find(id);
  if (it == _pimpl->sessions.end())
    return nullptr;

  return &it->second;
}

//==============================================================================
const Session* SpotStore::session(const TicketId id) const
{
  return const_cast<SpotStore*>(this)->session(id);
}

//==============================================================================
Session* SpotStore::active_session_for_vehicle(const std::string& plate)
{
  const auto it = _pimpl->active_by_vehicle.find(plate);
  if (it == _pimpl->active_by_vehicle.end())
    return nullptr;

  return session(it->second);
}

//==============================================================================
const Session* SpotStore::active_session_for_vehicle(
  const std::string& plate) const
{
  return const_cast<SpotStore*>(this)->active_session_for_vehicle(plate);
}

//==============================================================================
void SpotStore::complete_session(const TicketId id)
{
  const auto it = _pimpl->sessions.find(id);
  if (it == _pimpl->sessions.end())
    return;

  const auto index = _pimpl->active_by_vehicle.find(
    it->second.vehicle().plate());

  // Only erase the index entry if it still refers to this ticket
  if (index != _pimpl->active_by_vehicle.end() && index->second == id)
    _pimpl->active_by_vehicle.erase(index);
}

//==============================================================================
std::vector<const Session*> SpotStore::sessions() const
{
  std::vector<const Session*> output;
  output.reserve(_pimpl->sessions.size());
  for (const auto& element : _pimpl->sessions)
    output.push_back(&element.second);

  return output;
}

//==============================================================================
std::vector<const Session*> SpotStore::active_sessions() const
{
  std::vector<const Session*> output;
  output.reserve(_pimpl->active_by_vehicle.size());
  for (const auto& element : _pimpl->sessions)
  {
    if (element.second.active())
      output.push_back(&element.second);
  }

  return output;
}

} // namespace parklot
