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

#include <parklot/Spot.hpp>
#include <parklot/errors.hpp>

namespace parklot {

//==============================================================================
std::string to_string(const CapacityClass capacity)
{
  switch (capacity)
  {
    case CapacityClass::SmallOnly:
      return "small_only";
    case CapacityClass::MediumCapable:
      return "medium_capable";
    case CapacityClass::LargeCapable:
      return "large_capable";
  }

  return "unknown[" + std::to_string(static_cast<int>(capacity)) + "]";
}

//==============================================================================
std::optional<CapacityClass> capacity_class_from_string(
  const std::string& label)
{
  for (const auto capacity : AllCapacityClasses)
  {
    if (to_string(capacity) == label)
      return capacity;
  }

  return std::nullopt;
}

//==============================================================================
bool fits(const CapacityClass capacity, const VehicleSize size)
{
  switch (capacity)
  {
    case CapacityClass::SmallOnly:
      return size == VehicleSize::Small;
    case CapacityClass::MediumCapable:
      return size == VehicleSize::Small || size == VehicleSize::Medium;
    case CapacityClass::LargeCapable:
      return true;
  }

  return false;
}

//==============================================================================
class Spot::Implementation
{
public:

  std::string id;
  std::size_t floor;
  CapacityClass capacity;
  std::optional<std::string> occupant;

};

//==============================================================================
Spot::Spot(
  std::string id,
  const std::size_t floor,
  const CapacityClass capacity)
: _pimpl(utils::make_impl<Implementation>(
      Implementation{std::move(id), floor, capacity, std::nullopt}))
{
  // Do nothing
}

//==============================================================================
const std::string& Spot::id() const
{
  return _pimpl->id;
}

//==============================================================================
std::size_t Spot::floor() const
{
  return _pimpl->floor;
}

//==============================================================================
CapacityClass Spot::capacity() const
{
  return _pimpl->capacity;
}

//==============================================================================
bool Spot::available() const
{
  return !_pimpl->occupant.has_value();
}

//==============================================================================
const std::optional<std::string>& Spot::occupant() const
{
  return _pimpl->occupant;
}

//==============================================================================
bool Spot::fits(const VehicleSize size) const
{
  return parklot::fits(_pimpl->capacity, size);
}

//==============================================================================
Spot& Spot::occupy(std::string vehicle_id)
{
  if (_pimpl->occupant)
  {
    throw spot_conflict_error(
      _pimpl->id, "is already occupied by [" + *_pimpl->occupant + "]");
  }

  _pimpl->occupant = std::move(vehicle_id);
  return *this;
}

//==============================================================================
Spot& Spot::release()
{
  if (!_pimpl->occupant)
    throw spot_conflict_error(_pimpl->id, "is already available");

  _pimpl->occupant = std::nullopt;
  return *this;
}

} // namespace parklot
