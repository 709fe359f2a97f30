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

#include <parklot/Vehicle.hpp>

namespace parklot {

//==============================================================================
std::string to_string(const VehicleSize size)
{
  switch (size)
  {
    case VehicleSize::Small:
      return "small";
    case VehicleSize::Medium:
      return "medium";
    case VehicleSize::Large:
      return "large";
  }

  return "unknown[" + std::to_string(static_cast<int>(size)) + "]";
}

//==============================================================================
std::optional<VehicleSize> vehicle_size_from_string(const std::string& label)
{
  if (label == "small")
    return VehicleSize::Small;

  if (label == "medium")
    return VehicleSize::Medium;

  if (label == "large")
    return VehicleSize::Large;

  return std::nullopt;
}

//==============================================================================
class Vehicle::Implementation
{
public:

  std::string plate;
  VehicleSize size;
  std::optional<std::string> owner;

};

//==============================================================================
Vehicle::Vehicle(
  std::string plate,
  const VehicleSize size,
  std::optional<std::string> owner)
: _pimpl(utils::make_impl<Implementation>(
      Implementation{std::move(plate), size, std::move(owner)}))
{
  // Do nothing
}

//==============================================================================
const std::string& Vehicle::plate() const
{
  return _pimpl->plate;
}

//==============================================================================
VehicleSize Vehicle::size() const
{
  return _pimpl->size;
}

//==============================================================================
const std::optional<std::string>& Vehicle::owner() const
{
  return _pimpl->owner;
}

} // namespace parklot
