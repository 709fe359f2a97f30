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

#ifndef PARKLOT__ERRORS_HPP
#define PARKLOT__ERRORS_HPP

#include <parklot/Vehicle.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <cstddef>
#include <exception>
#include <string>

namespace parklot {

//==============================================================================
/// Base class of every error that the parking lot reports to its callers.
/// An operation that throws one of these has not changed any state.
class parking_error : public std::exception
{
public:

  const char* what() const noexcept override;

  class Implementation;
protected:
  /// \param[in] source
  ///   The component and operation that detected the error, e.g.
  ///   "SessionService::check_in"
  ///
  /// \param[in] message
  ///   Description of the problem
  parking_error(const std::string& source, const std::string& message);

private:
  utils::impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// A vehicle tried to check in while it still has an active session.
class already_parked_error : public parking_error
{
public:
  already_parked_error(
    const std::string& vehicle_id,
    const std::string& spot_id);
};

//==============================================================================
/// A session that was already completed was asked to complete again.
class already_completed_error : public parking_error
{
public:
  already_completed_error(std::size_t ticket_id);
};

//==============================================================================
/// A spot was asked to change into the occupancy state that it already has,
/// e.g. releasing a spot that is already available.
class spot_conflict_error : public parking_error
{
public:
  spot_conflict_error(const std::string& spot_id, const std::string& problem);
};

//==============================================================================
/// A vehicle tried to check out without an active session.
class no_active_session_error : public parking_error
{
public:
  no_active_session_error(const std::string& vehicle_id);
};

//==============================================================================
/// An operation referred to a spot identifier that the lot does not have.
class spot_not_found_error : public parking_error
{
public:
  spot_not_found_error(const std::string& source, const std::string& spot_id);
};

//==============================================================================
/// The fee table has no rate for a vehicle size. This indicates a setup bug.
class unknown_vehicle_class_error : public parking_error
{
public:
  unknown_vehicle_class_error(VehicleSize size);
};

} // namespace parklot

#endif // PARKLOT__ERRORS_HPP
