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

#ifndef PARKLOT__FEECALCULATOR_HPP
#define PARKLOT__FEECALCULATOR_HPP

#include <parklot/Vehicle.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace parklot {

//==============================================================================
class FeeCalculator
{
public:

  /// The price of parking one vehicle size.
  class Rate
  {
  public:

    /// Returns a Rate if valid values were supplied, otherwise std::nullopt.
    /// Here valid means finite and not negative.
    ///
    /// \param[in] base_fee
    ///   Flat fee that covers the first hour, or any part of it
    ///
    /// \param[in] hourly_rate
    ///   Fee for each additional hour, or any part of it
    static std::optional<Rate> make(double base_fee, double hourly_rate);

    /// Get the base fee
    double base_fee() const;

    /// Get the hourly rate
    double hourly_rate() const;

    class Implementation;
  private:
    Rate();
    utils::impl_ptr<Implementation> _pimpl;
  };

  using RateTable = std::vector<std::pair<VehicleSize, Rate>>;

  /// The rates that are used when no table is given:
  ///
  /// | size   | base  | hourly |
  /// |--------|-------|--------|
  /// | small  |  2.00 |  1.00  |
  /// | medium |  5.00 |  2.50  |
  /// | large  | 10.00 |  5.00  |
  static RateTable default_rates();

  /// Construct a calculator that uses default_rates()
  FeeCalculator();

  /// Construct a calculator that uses the given rate table. Any vehicle size
  /// that is missing from the table has no rate.
  explicit FeeCalculator(RateTable rates);

  /// Compute the fee for a stay.
  ///
  /// The duration is rounded up to the next whole hour. A stay of up to one
  /// hour costs the base fee; every hour after that adds the hourly rate.
  /// A negative duration is treated as zero.
  ///
  /// \param[in] size
  ///   The size class of the vehicle
  ///
  /// \param[in] duration_hours
  ///   How long the vehicle was parked, in hours
  ///
  /// \throws unknown_vehicle_class_error if the table has no rate for size.
  double compute_fee(VehicleSize size, double duration_hours) const;

  /// Get the rate for a vehicle size, if there is one.
  std::optional<Rate> rate(VehicleSize size) const;

  /// Set the rate for a vehicle size.
  ///
  /// \warning This is not synchronized with compute_fee(). Finish configuring
  /// the calculator before handing it to a SessionService.
  FeeCalculator& set_rate(VehicleSize size, Rate rate);

  class Implementation;
private:
  utils::impl_ptr<Implementation> _pimpl;
};

using ConstFeeCalculatorPtr = std::shared_ptr<const FeeCalculator>;

} // namespace parklot

#endif // PARKLOT__FEECALCULATOR_HPP
