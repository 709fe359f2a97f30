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

#ifndef PARKLOT__VEHICLE_HPP
#define PARKLOT__VEHICLE_HPP

#include <parklot/utils/impl_ptr.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace parklot {

//==============================================================================
/// The size class of a vehicle. This decides which spots can host it.
enum class VehicleSize : uint8_t
{
  /// Motorcycles
  Small = 0,

  /// Cars
  Medium,

  /// Buses
  Large
};

/// Get the lowercase label of a vehicle size ("small", "medium" or "large").
std::string to_string(VehicleSize size);

/// Parse a label produced by to_string(VehicleSize).
///
/// \return std::nullopt if the label does not name a vehicle size.
std::optional<VehicleSize> vehicle_size_from_string(const std::string& label);

//==============================================================================
/// An immutable description of a vehicle that visits the lot.
class Vehicle
{
public:

  /// Constructor
  ///
  /// \param[in] plate
  ///   The license plate. This is the unique key of the vehicle.
  ///
  /// \param[in] size
  ///   The size class of the vehicle.
  ///
  /// \param[in] owner
  ///   An optional label for the owner of the vehicle.
  Vehicle(
    std::string plate,
    VehicleSize size,
    std::optional<std::string> owner = std::nullopt);

  /// The license plate of the vehicle
  const std::string& plate() const;

  /// The size class of the vehicle
  VehicleSize size() const;

  /// The owner label, if one was given
  const std::optional<std::string>& owner() const;

  class Implementation;
private:
  utils::impl_ptr<Implementation> _pimpl;
};

} // namespace parklot

#endif // PARKLOT__VEHICLE_HPP
