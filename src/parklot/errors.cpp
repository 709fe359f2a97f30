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

#include <parklot/errors.hpp>

namespace parklot {

//==============================================================================
class parking_error::Implementation
{
public:

  std::string what;

};

//==============================================================================
parking_error::parking_error(
  const std::string& source,
  const std::string& message)
: _pimpl(utils::make_impl<Implementation>(
      Implementation{"[parklot::" + source + "] " + message}))
{
  // Do nothing
}

//==============================================================================
const char* parking_error::what() const noexcept
{
  return _pimpl->what.c_str();
}

//==============================================================================
already_parked_error::already_parked_error(
  const std::string& vehicle_id,
  const std::string& spot_id)
: parking_error(
    "SessionService::check_in",
    "Vehicle [" + vehicle_id + "] is already parked at spot ["
    + spot_id + "]")
{
  // Do nothing
}

//==============================================================================
already_completed_error::already_completed_error(
  const std::size_t ticket_id)
: parking_error(
    "Session::complete",
    "Ticket [" + std::to_string(ticket_id) + "] is already completed")
{
  // Do nothing
}

//==============================================================================
spot_conflict_error::spot_conflict_error(
  const std::string& spot_id,
  const std::string& problem)
: parking_error("Spot", "Spot [" + spot_id + "] " + problem)
{
  // Do nothing
}

//==============================================================================
no_active_session_error::no_active_session_error(const std::string& vehicle_id)
: parking_error(
    "SessionService::check_out",
    "No active parking session found for vehicle [" + vehicle_id + "]")
{
  // Do nothing
}

//==============================================================================
spot_not_found_error::spot_not_found_error(
  const std::string& source,
  const std::string& spot_id)
: parking_error(source, "Spot [" + spot_id + "] not found")
{
  // Do nothing
}

//==============================================================================
unknown_vehicle_class_error::unknown_vehicle_class_error(
  const VehicleSize size)
: parking_error(
    "FeeCalculator::compute_fee",
    "No rate found for vehicle size [" + to_string(size) + "]")
{
  // Do nothing
}

} // namespace parklot
