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

#ifndef PARKLOT__LOTCONFIG_HPP
#define PARKLOT__LOTCONFIG_HPP

#include <parklot/FeeCalculator.hpp>
#include <parklot/Spot.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <yaml-cpp/yaml.h>

#include <memory>
#include <optional>
#include <string>

namespace parklot {

//==============================================================================
/// The LotConfig class describes the layout, the rate table and the optional
/// journal file of a lot. It is usually loaded with parse_lot_config().
class LotConfig
{
public:

  /// Constructor. The rate table starts as FeeCalculator::default_rates() and
  /// there is no journal file.
  ///
  /// \param[in] floors
  ///   Number of floors in the lot
  ///
  /// \param[in] spots_per_floor
  ///   Number of spots of each capacity class on every floor
  LotConfig(std::size_t floors, SpotsPerFloor spots_per_floor);

  /// Get the number of floors
  std::size_t floors() const;

  /// Set the number of floors
  LotConfig& floors(std::size_t new_floors);

  /// Get the number of spots of each capacity class on every floor
  const SpotsPerFloor& spots_per_floor() const;

  /// Set the number of spots of each capacity class on every floor
  LotConfig& spots_per_floor(SpotsPerFloor new_spots_per_floor);

  /// Get the rate table
  const FeeCalculator::RateTable& rates() const;

  /// Set the rate table
  LotConfig& rates(FeeCalculator::RateTable new_rates);

  /// Get the path of the session journal, if sessions should be persisted
  const std::optional<std::string>& journal_file() const;

  /// Set the path of the session journal
  LotConfig& journal_file(std::optional<std::string> new_journal_file);

  /// Total number of spots in the lot
  std::size_t total_spots() const;

  /// Make a FeeCalculator for the rate table of this configuration
  std::shared_ptr<FeeCalculator> make_fee_calculator() const;

  class Implementation;
private:
  utils::impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// Parse a lot configuration from a YAML node.
///
/// \throws std::runtime_error if a required key is missing or a value is
/// invalid.
///
/// \throws YAML::Exception if a value has the wrong type.
LotConfig parse_lot_config(const YAML::Node& node);

//==============================================================================
/// Load and parse a lot configuration file.
///
/// \throws YAML::Exception if the file cannot be read or has a syntax error.
///
/// \throws std::runtime_error naming the file if its contents do not describe
/// a valid lot.
LotConfig parse_lot_config(const std::string& config_file);

} // namespace parklot

#endif // PARKLOT__LOTCONFIG_HPP
