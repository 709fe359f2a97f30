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

#ifndef PARKLOT__SESSION_HPP
#define PARKLOT__SESSION_HPP

#include <parklot/Time.hpp>
#include <parklot/Vehicle.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <optional>
#include <string>
#include <variant>

namespace parklot {

//==============================================================================
using TicketId = std::size_t;

//==============================================================================
/// The record of one vehicle's stay in the lot, from entry to exit. This is
/// what a parking ticket represents.
///
/// A session is either Active or Completed. The exit time and fee only exist
/// inside the Completed status, so a session can never be partially
/// completed.
class Session
{
public:

  /// The vehicle is still parked.
  struct Active {};

  /// The vehicle has left and the fee has been computed.
  struct Completed
  {
    Time exit_time;
    double fee;
  };

  using Status = std::variant<Active, Completed>;

  /// Constructor. A new session is always Active.
  ///
  /// \param[in] ticket_id
  ///   Unique identifier of the ticket
  ///
  /// \param[in] vehicle
  ///   The vehicle that this session belongs to
  ///
  /// \param[in] spot_id
  ///   The spot that the vehicle occupies
  ///
  /// \param[in] entry_time
  ///   The time when the vehicle entered the lot
  Session(
    TicketId ticket_id,
    Vehicle vehicle,
    std::string spot_id,
    Time entry_time);

  /// The unique identifier of this ticket
  TicketId ticket_id() const;

  /// The vehicle that this session belongs to
  const Vehicle& vehicle() const;

  /// The spot that the vehicle occupies (or occupied)
  const std::string& spot_id() const;

  /// When the vehicle entered
  Time entry_time() const;

  /// The current status of the session
  const Status& status() const;

  /// True if the vehicle has not checked out yet
  bool active() const;

  /// Get the completion details, or a nullptr if the session is still active.
  const Completed* completed() const;

  /// The exit time, if the session is completed
  std::optional<Time> exit_time() const;

  /// The fee, if the session is completed
  std::optional<double> fee() const;

  /// How long the vehicle has been (or was) parked. For an active session
  /// this is measured up to the given time.
  Duration duration(Time now) const;

  /// Complete this session.
  ///
  /// \throws already_completed_error if the session is already completed. The
  /// session is left unchanged in that case.
  Session& complete(Time exit_time, double fee);

  class Implementation;
private:
  utils::impl_ptr<Implementation> _pimpl;
};

} // namespace parklot

#endif // PARKLOT__SESSION_HPP
