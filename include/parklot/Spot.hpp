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

#ifndef PARKLOT__SPOT_HPP
#define PARKLOT__SPOT_HPP

#include <parklot/Vehicle.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace parklot {

//==============================================================================
/// The largest vehicle size that a spot can host.
enum class CapacityClass : uint8_t
{
  /// Hosts small vehicles only
  SmallOnly = 0,

  /// Hosts small and medium vehicles
  MediumCapable,

  /// Hosts vehicles of every size
  LargeCapable
};

/// Every capacity class, in declaration order
constexpr std::array<CapacityClass, 3> AllCapacityClasses = {
  CapacityClass::SmallOnly,
  CapacityClass::MediumCapable,
  CapacityClass::LargeCapable
};

/// Number of spots of each capacity class on one floor. A class that is
/// missing from the map has no spots.
using SpotsPerFloor = std::map<CapacityClass, std::size_t>;

/// Get the label of a capacity class ("small_only", "medium_capable" or
/// "large_capable").
std::string to_string(CapacityClass capacity);

/// Parse a label produced by to_string(CapacityClass).
///
/// \return std::nullopt if the label does not name a capacity class.
std::optional<CapacityClass> capacity_class_from_string(
  const std::string& label);

/// True if a spot of the given capacity class can host a vehicle of the given
/// size. This is a fixed partial order: SmallOnly < MediumCapable <
/// LargeCapable.
bool fits(CapacityClass capacity, VehicleSize size);

//==============================================================================
/// A physical parking location with a fixed floor and capacity class.
///
/// The occupancy of a spot is mutable, but only the SpotAllocator changes it.
class Spot
{
public:

  /// Constructor. A new spot is always available.
  ///
  /// \param[in] id
  ///   Unique identifier of the spot
  ///
  /// \param[in] floor
  ///   The floor that the spot is on, starting from 1
  ///
  /// \param[in] capacity
  ///   The capacity class of the spot
  Spot(std::string id, std::size_t floor, CapacityClass capacity);

  /// The unique identifier of this spot
  const std::string& id() const;

  /// The floor that this spot is on
  std::size_t floor() const;

  /// The capacity class of this spot
  CapacityClass capacity() const;

  /// True if nothing is parked here
  bool available() const;

  /// The plate of the vehicle that occupies this spot, if any
  const std::optional<std::string>& occupant() const;

  /// True if this spot's capacity class can host the given vehicle size.
  /// This does not consider whether the spot is currently available.
  bool fits(VehicleSize size) const;

  /// Mark this spot as occupied by the given vehicle.
  ///
  /// \throws spot_conflict_error if the spot is already occupied.
  Spot& occupy(std::string vehicle_id);

  /// Mark this spot as available.
  ///
  /// \throws spot_conflict_error if the spot is already available.
  Spot& release();

  class Implementation;
private:
  utils::impl_ptr<Implementation> _pimpl;
};

} // namespace parklot

#endif // PARKLOT__SPOT_HPP
