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

#include <catch2/catch.hpp>

#include <limits>

SCENARIO("Test FeeCalculator with the default rates")
{
  using parklot::VehicleSize;
  const parklot::FeeCalculator fees;

  WHEN("A stay is shorter than an hour")
  {
    CHECK(fees.compute_fee(VehicleSize::Small, 0.5) == Approx(2.0));
    CHECK(fees.compute_fee(VehicleSize::Medium, 0.01) == Approx(5.0));
    CHECK(fees.compute_fee(VehicleSize::Large, 1.0) == Approx(10.0));
  }

  WHEN("A stay has no duration")
  {
    CHECK(fees.compute_fee(VehicleSize::Small, 0.0) == Approx(2.0));
  }

  WHEN("A stay has a negative duration")
  {
    CHECK(fees.compute_fee(VehicleSize::Medium, -3.0) == Approx(5.0));
  }

  WHEN("A stay lasts several hours")
  {
    // 3.5 hours is charged as 4 hours, which is 3 hours past the first
    CHECK(fees.compute_fee(VehicleSize::Medium, 3.5) == Approx(12.5));
    CHECK(fees.compute_fee(VehicleSize::Medium, 4.0) == Approx(12.5));
    CHECK(fees.compute_fee(VehicleSize::Small, 1.01) == Approx(3.0));
    CHECK(fees.compute_fee(VehicleSize::Large, 24.0) == Approx(125.0));
  }
}

SCENARIO("Test FeeCalculator with a custom rate table")
{
  using parklot::FeeCalculator;
  using parklot::VehicleSize;

  const auto cheap = FeeCalculator::Rate::make(1.0, 0.5);
  REQUIRE(cheap);

  FeeCalculator fees({{VehicleSize::Small, *cheap}});

  GIVEN("A size that has a rate")
  {
    CHECK(fees.compute_fee(VehicleSize::Small, 2.5) == Approx(2.0));
  }

  GIVEN("A size that has no rate")
  {
    CHECK_FALSE(fees.rate(VehicleSize::Large));
    CHECK_THROWS_AS(
      fees.compute_fee(VehicleSize::Large, 1.0),
      parklot::unknown_vehicle_class_error);

    WHEN("The rate is added afterwards")
    {
      fees.set_rate(VehicleSize::Large, *FeeCalculator::Rate::make(4.0, 2.0));
      REQUIRE(fees.rate(VehicleSize::Large));
      CHECK(fees.rate(VehicleSize::Large)->base_fee() == Approx(4.0));
      CHECK(fees.compute_fee(VehicleSize::Large, 2.0) == Approx(6.0));
    }
  }
}

SCENARIO("Test FeeCalculator::Rate")
{
  using Rate = parklot::FeeCalculator::Rate;

  WHEN("Valid values are supplied to make()")
  {
    const auto rate = Rate::make(5.0, 2.5);
    REQUIRE(rate);
    CHECK(rate->base_fee() == 5.0);
    CHECK(rate->hourly_rate() == 2.5);
  }

  WHEN("Free parking is supplied to make()")
  {
    CHECK(Rate::make(0.0, 0.0));
  }

  WHEN("In-valid values are supplied to make()")
  {
    CHECK_FALSE(Rate::make(-1.0, 2.5));
    CHECK_FALSE(Rate::make(5.0, -0.1));
    CHECK_FALSE(Rate::make(std::numeric_limits<double>::infinity(), 1.0));
    CHECK_FALSE(Rate::make(1.0, std::numeric_limits<double>::quiet_NaN()));
  }
}
