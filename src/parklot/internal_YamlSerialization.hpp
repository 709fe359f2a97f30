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

#ifndef SRC__PARKLOT__INTERNAL_YAMLSERIALIZATION_HPP
#define SRC__PARKLOT__INTERNAL_YAMLSERIALIZATION_HPP

#include <parklot/FeeCalculator.hpp>
#include <parklot/Session.hpp>
#include <parklot/Spot.hpp>
#include <parklot/Vehicle.hpp>

#include <yaml-cpp/yaml.h>

namespace parklot {

//==============================================================================
VehicleSize vehicle_size(const YAML::Node& node);

//==============================================================================
CapacityClass capacity_class(const YAML::Node& node);

//==============================================================================
Vehicle vehicle(const YAML::Node& node);

//==============================================================================
Session session(const YAML::Node& node);

//==============================================================================
FeeCalculator::Rate rate(const YAML::Node& node);

//==============================================================================
YAML::Node serialize(const Vehicle& vehicle);

//==============================================================================
YAML::Node serialize(const Session& session);

//==============================================================================
YAML::Node serialize(const FeeCalculator::Rate& rate);

} // namespace parklot

#endif // SRC__PARKLOT__INTERNAL_YAMLSERIALIZATION_HPP
