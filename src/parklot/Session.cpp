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

#include <parklot/Session.hpp>
#include <parklot/errors.hpp>

namespace parklot {

//==============================================================================
class Session::Implementation
{
public:

  TicketId ticket_id;
  Vehicle vehicle;
  std::string spot_id;
  Time entry_time;
  Status status;

};

//==============================================================================
Session::Session(
  const TicketId ticket_id,
  Vehicle vehicle,
  std::string spot_id,
  const Time entry_time)
: _pimpl(utils::make_impl<Implementation>(
      Implementation{
        ticket_id,
        std::move(vehicle),
        std::move(spot_id),
        entry_time,
        Active{}
      }))
{
  // Do nothing
}

//==============================================================================
TicketId Session::ticket_id() const
{
  return _pimpl->ticket_id;
}

//==============================================================================
const Vehicle& Session::vehicle() const
{
  return _pimpl->vehicle;
}

//==============================================================================
const std::string& Session::spot_id() const
{
  return _pimpl->spot_id;
}

//==============================================================================
Time Session::entry_time() const
{
  return _pimpl->entry_time;
}

//==============================================================================
auto Session::status() const -> const Status&
{
  return _pimpl->status;
}

//==============================================================================
bool Session::active() const
{
  return std::holds_alternative<Active>(_pimpl->status);
}

//==============================================================================
auto Session::completed() const -> const Completed*
{
  return std::get_if<Completed>(&_pimpl->status);
}

//==============================================================================
std::optional<Time> Session::exit_time() const
{
  if (const auto* c = completed())
    return c->exit_time;

  return std::nullopt;
}

//==============================================================================
std::optional<double> Session::fee() const
{
  if (const auto* c = completed())
    return c->fee;

  return std::nullopt;
}

//==============================================================================
Duration Session::duration(const Time now) const
{
  if (const auto* c = completed())
    return c->exit_time - _pimpl->entry_time;

  return now - _pimpl->entry_time;
}

//==============================================================================
Session& Session::complete(const Time exit_time, const double fee)
{
  if (!active())
    throw already_completed_error(_pimpl->ticket_id);

  _pimpl->status = Completed{exit_time, fee};
  return *this;
}

} // namespace parklot
