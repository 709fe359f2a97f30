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

#include <parklot/LotConfig.hpp>

#include "internal_YamlSerialization.hpp"

#include <stdexcept>

namespace parklot {

//==============================================================================
class LotConfig::Implementation
{
public:

  std::size_t floors;
  SpotsPerFloor spots_per_floor;
  FeeCalculator::RateTable rates;
  std::optional<std::string> journal_file;

};

//==============================================================================
LotConfig::LotConfig(const std::size_t floors, SpotsPerFloor spots_per_floor)
: _pimpl(utils::make_impl<Implementation>(
      Implementation{
        floors,
        std::move(spots_per_floor),
        FeeCalculator::default_rates(),
        std::nullopt
      }))
{
  // Do nothing
}

//==============================================================================
std::size_t LotConfig::floors() const
{
  return _pimpl->floors;
}

//==============================================================================
LotConfig& LotConfig::floors(const std::size_t new_floors)
{
  _pimpl->floors = new_floors;
  return *this;
}

//==============================================================================
const SpotsPerFloor& LotConfig::spots_per_floor() const
{
  return _pimpl->spots_per_floor;
}

//==============================================================================
LotConfig& LotConfig::spots_per_floor(SpotsPerFloor new_spots_per_floor)
{
  _pimpl->spots_per_floor = std::move(new_spots_per_floor);
  return *this;
}

//==============================================================================
const FeeCalculator::RateTable& LotConfig::rates() const
{
  return _pimpl->rates;
}

//==============================================================================
LotConfig& LotConfig::rates(FeeCalculator::RateTable new_rates)
{
  _pimpl->rates = std::move(new_rates);
  return *this;
}

//==============================================================================
const std::optional<std::string>& LotConfig::journal_file() const
{
  return _pimpl->journal_file;
}

//==============================================================================
LotConfig& LotConfig::journal_file(std::optional<std::string> new_journal_file)
{
  _pimpl->journal_file = std::move(new_journal_file);
  return *this;
}

//==============================================================================
std::size_t LotConfig::total_spots() const
{
  std::size_t per_floor = 0;
  for (const auto& entry : _pimpl->spots_per_floor)
    per_floor += entry.second;

  return _pimpl->floors * per_floor;
}

//==============================================================================
std::shared_ptr<FeeCalculator> LotConfig::make_fee_calculator() const
{
  return std::make_shared<FeeCalculator>(_pimpl->rates);
}

//==============================================================================
LotConfig parse_lot_config(const YAML::Node& node)
{
  if (!node.IsMap())
  {
    throw std::runtime_error(
      "The lot configuration must be a map");
  }

  const YAML::Node floors_node = node["floors"];
  if (!floors_node)
  {
    throw std::runtime_error(
      "The lot configuration is missing the [floors] key");
  }

  const auto floors = floors_node.as<long long>();
  if (floors < 1)
  {
    throw std::runtime_error(
      "The [floors] key must be at least 1, but it is ["
      + std::to_string(floors) + "]");
  }

  const YAML::Node spots_node = node["spots_per_floor"];
  if (!spots_node)
  {
    throw std::runtime_error(
      "The lot configuration is missing the [spots_per_floor] key");
  }

  if (!spots_node.IsMap())
  {
    throw std::runtime_error(
      "The [spots_per_floor] key does not point to a map");
  }

  SpotsPerFloor spots_per_floor;
  for (const auto& entry : spots_node)
  {
    const CapacityClass capacity = capacity_class(entry.first);
    const auto count = entry.second.as<long long>();
    if (count < 0)
    {
      throw std::runtime_error(
        "The number of [" + to_string(capacity) + "] spots per floor must not "
        "be negative, but it is [" + std::to_string(count) + "]");
    }

    spots_per_floor[capacity] = static_cast<std::size_t>(count);
  }

  LotConfig config(
    static_cast<std::size_t>(floors), std::move(spots_per_floor));

  const YAML::Node rates_node = node["rates"];
  if (rates_node)
  {
    if (!rates_node.IsMap())
    {
      throw std::runtime_error(
        "The [rates] key does not point to a map");
    }

    // Sizes that the file does not mention keep their default rate
    FeeCalculator fees(config.rates());
    for (const auto& entry : rates_node)
      fees.set_rate(vehicle_size(entry.first), rate(entry.second));

    FeeCalculator::RateTable table;
    for (const auto size :
      {VehicleSize::Small, VehicleSize::Medium, VehicleSize::Large})
    {
      if (auto r = fees.rate(size))
        table.push_back({size, std::move(*r)});
    }

    config.rates(std::move(table));
  }

  const YAML::Node journal_node = node["journal"];
  if (journal_node)
    config.journal_file(journal_node.as<std::string>());

  return config;
}

//==============================================================================
LotConfig parse_lot_config(const std::string& config_file)
{
  const YAML::Node config = YAML::LoadFile(config_file);
  if (!config)
  {
    throw std::runtime_error(
      "Failed to load lot configuration file [" + config_file + "]");
  }

  try
  {
    return parse_lot_config(config);
  }
  catch (const std::runtime_error& e)
  {
    throw std::runtime_error(
      "Invalid lot configuration file [" + config_file + "]: " + e.what());
  }
}

} // namespace parklot
