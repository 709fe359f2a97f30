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

#include <parklot/FeeCalculator.hpp>
#include <parklot/errors.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace parklot {

//==============================================================================
class FeeCalculator::Rate::Implementation
{
public:
  double base_fee;
  double hourly_rate;
};

//==============================================================================
std::optional<FeeCalculator::Rate> FeeCalculator::Rate::make(
  const double base_fee,
  const double hourly_rate)
{
  if (!std::isfinite(base_fee) || !std::isfinite(hourly_rate)
    || base_fee < 0.0 || hourly_rate < 0.0)
  {
    return std::nullopt;
  }

  Rate rate;
  rate._pimpl->base_fee = base_fee;
  rate._pimpl->hourly_rate = hourly_rate;

  return rate;
}

//==============================================================================
FeeCalculator::Rate::Rate()
: _pimpl(utils::make_impl<Implementation>(Implementation()))
{
  // Do nothing
}

//==============================================================================
double FeeCalculator::Rate::base_fee() const
{
  return _pimpl->base_fee;
}

//==============================================================================
double FeeCalculator::Rate::hourly_rate() const
{
  return _pimpl->hourly_rate;
}

//==============================================================================
class FeeCalculator::Implementation
{
public:

  std::unordered_map<VehicleSize, Rate> rates;

  Implementation(RateTable table)
  {
    for (auto& entry : table)
      rates.insert_or_assign(entry.first, std::move(entry.second));
  }

};

//==============================================================================
auto FeeCalculator::default_rates() -> RateTable
{
  return {
    {VehicleSize::Small, *Rate::make(2.0, 1.0)},
    {VehicleSize::Medium, *Rate::make(5.0, 2.5)},
    {VehicleSize::Large, *Rate::make(10.0, 5.0)}
  };
}

//==============================================================================
FeeCalculator::FeeCalculator()
: FeeCalculator(default_rates())
{
  // Do nothing
}

//==============================================================================
FeeCalculator::FeeCalculator(RateTable rates)
: _pimpl(utils::make_impl<Implementation>(std::move(rates)))
{
  // Do nothing
}

//==============================================================================
double FeeCalculator::compute_fee(
  const VehicleSize size,
  const double duration_hours) const
{
  const auto it = _pimpl->rates.find(size);
  if (it == _pimpl->rates.end())
    throw unknown_vehicle_class_error(size);

  const Rate& rate = it->second;

  // Partial hours are charged as whole hours
  const double hours = std::ceil(std::max(0.0, duration_hours));
  if (hours <= 1.0)
    return rate.base_fee();

  return rate.base_fee() + (hours - 1.0) * rate.hourly_rate();
}

//==============================================================================
auto FeeCalculator::rate(const VehicleSize size) const -> std::optional<Rate>
{
  const auto it = _pimpl->rates.find(size);
  if (it == _pimpl->rates.end())
    return std::nullopt;

  return it->second;
}

//==============================================================================
FeeCalculator& FeeCalculator::set_rate(const VehicleSize size, Rate rate)
{
  _pimpl->rates.insert_or_assign(size, std::move(rate));
  return *this;
}

} // namespace parklot
