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

#include "internal_YamlSerialization.hpp"

namespace parklot {

namespace {
const std::string TicketKey = "ticket";
const std::string PlateKey = "plate";
const std::string SizeKey = "size";
const std::string OwnerKey = "owner";
const std::string VehicleKey = "vehicle";
const std::string SpotKey = "spot";
const std::string EntryKey = "entry_ms";
const std::string ExitKey = "exit_ms";
const std::string FeeKey = "fee";
const std::string BaseFeeKey = "base_fee";
const std::string HourlyRateKey = "hourly_rate";

//==============================================================================
void require(const YAML::Node& node, const std::string& key,
  const std::string& what)
{
  if (!node[key])
  {
    throw YAML::ParserException(node.Mark(),
      what + " missing [" + key + "]");
  }
}
} // anonymous namespace

//==============================================================================
VehicleSize vehicle_size(const YAML::Node& node)
{
  const auto label = node.as<std::string>();
  if (const auto size = vehicle_size_from_string(label))
    return *size;

  throw YAML::ParserException(node.Mark(),
    "Unknown vehicle size [" + label + "]. Must be one of [small], [medium], "
    "[large]");
}

//==============================================================================
CapacityClass capacity_class(const YAML::Node& node)
{
  const auto label = node.as<std::string>();
  if (const auto capacity = capacity_class_from_string(label))
    return *capacity;

  throw YAML::ParserException(node.Mark(),
    "Unknown capacity class [" + label + "]. Must be one of [small_only], "
    "[medium_capable], [large_capable]");
}

//==============================================================================
Vehicle vehicle(const YAML::Node& node)
{
  if (!node.IsMap())
  {
    throw YAML::ParserException(node.Mark(),
      "Vehicle information should be a map");
  }

  require(node, PlateKey, "Vehicle information");
  require(node, SizeKey, "Vehicle information");

  std::optional<std::string> owner;
  if (node[OwnerKey])
    owner = node[OwnerKey].as<std::string>();

  return Vehicle(
    node[PlateKey].as<std::string>(),
    vehicle_size(node[SizeKey]),
    std::move(owner));
}

//==============================================================================
Session session(const YAML::Node& node)
{
  if (!node.IsMap())
  {
    throw YAML::ParserException(node.Mark(),
      "Session record should be a map");
  }

  require(node, TicketKey, "Session record");
  require(node, VehicleKey, "Session record");
  require(node, SpotKey, "Session record");
  require(node, EntryKey, "Session record");

  Session output(
    node[TicketKey].as<TicketId>(),
    vehicle(node[VehicleKey]),
    node[SpotKey].as<std::string>(),
    time::from_epoch_millis(node[EntryKey].as<std::int64_t>()));

  const bool has_exit = static_cast<bool>(node[ExitKey]);
  const bool has_fee = static_cast<bool>(node[FeeKey]);
  if (has_exit != has_fee)
  {
    throw YAML::ParserException(node.Mark(),
      "Session record must contain both [" + ExitKey + "] and [" + FeeKey
      + "] or neither of them");
  }

  if (has_exit)
  {
    output.complete(
      time::from_epoch_millis(node[ExitKey].as<std::int64_t>()),
      node[FeeKey].as<double>());
  }

  return output;
}

//==============================================================================
FeeCalculator::Rate rate(const YAML::Node& node)
{
  if (!node.IsMap())
  {
    throw YAML::ParserException(node.Mark(),
      "Rate information should be a map");
  }

  require(node, BaseFeeKey, "Rate information");
  require(node, HourlyRateKey, "Rate information");

  const double base_fee = node[BaseFeeKey].as<double>();
  const double hourly_rate = node[HourlyRateKey].as<double>();
  const auto output = FeeCalculator::Rate::make(base_fee, hourly_rate);
  if (!output)
  {
    throw YAML::ParserException(node.Mark(),
      "Rate has an invalid value. [" + BaseFeeKey + "] and ["
      + HourlyRateKey + "] must be finite and not negative");
  }

  return *output;
}

//==============================================================================
YAML::Node serialize(const Vehicle& vehicle)
{
  YAML::Node node;
  node[PlateKey] = vehicle.plate();
  node[SizeKey] = to_string(vehicle.size());
  if (vehicle.owner())
    node[OwnerKey] = *vehicle.owner();

  return node;
}

//==============================================================================
YAML::Node serialize(const Session& session)
{
  YAML::Node node;
  node[TicketKey] = session.ticket_id();
  node[VehicleKey] = serialize(session.vehicle());
  node[SpotKey] = session.spot_id();
  node[EntryKey] = time::to_epoch_millis(session.entry_time());

  if (const auto* completed = session.completed())
  {
    node[ExitKey] = time::to_epoch_millis(completed->exit_time);
    node[FeeKey] = completed->fee;
  }

  return node;
}

//==============================================================================
YAML::Node serialize(const FeeCalculator::Rate& rate)
{
  YAML::Node node;
  node[BaseFeeKey] = rate.base_fee();
  node[HourlyRateKey] = rate.hourly_rate();
  return node;
}

} // namespace parklot
