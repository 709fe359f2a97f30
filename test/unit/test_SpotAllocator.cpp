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


#include <parklot/SpotAllocator.hpp>
#include <parklot/errors.hpp>

#include <catch2/catch.hpp>

#include <mutex>
#include <set>
#include <thread>

namespace {

//==============================================================================
std::shared_ptr<parklot::SpotStore> make_store(
  const std::vector<parklot::Spot>& spots)
{
  auto store = std::make_shared<parklot::SpotStore>();
  for (const auto& spot : spots)
    REQUIRE(store->add_spot(spot));

  return store;
}

} // anonymous namespace

SCENARIO("Test the allocation policy")
{
  using parklot::CapacityClass;
  using parklot::Spot;
  using parklot::VehicleSize;

  GIVEN("Medium spots on floors 3, 1 and 2")
  {
    parklot::SpotAllocator allocator(make_store({
        Spot("C001", 3, CapacityClass::MediumCapable),
        Spot("C002", 1, CapacityClass::MediumCapable),
        Spot("C003", 2, CapacityClass::MediumCapable)
      }));

    THEN("The lowest floor is chosen first")
    {
      const auto first = allocator.allocate(VehicleSize::Medium, "A");
      REQUIRE(first);
      CHECK(first->floor() == 1);
      CHECK(first->id() == "C002");
      REQUIRE(first->occupant());
      CHECK(*first->occupant() == "A");

      const auto second = allocator.allocate(VehicleSize::Medium, "B");
      REQUIRE(second);
      CHECK(second->floor() == 2);

      const auto third = allocator.allocate(VehicleSize::Medium, "C");
      REQUIRE(third);
      CHECK(third->floor() == 3);

      CHECK_FALSE(allocator.allocate(VehicleSize::Medium, "D"));
      CHECK_FALSE(allocator.has_capacity(VehicleSize::Small));
    }
  }

  GIVEN("Several spots on the same floor")
  {
    parklot::SpotAllocator allocator(make_store({
        Spot("L001", 1, CapacityClass::LargeCapable),
        Spot("C010", 1, CapacityClass::MediumCapable),
        Spot("C002", 1, CapacityClass::MediumCapable)
      }));

    THEN("Ties are broken by the spot identifier")
    {
      CHECK(allocator.allocate(VehicleSize::Small, "A")->id() == "C002");
      CHECK(allocator.allocate(VehicleSize::Small, "B")->id() == "C010");
      CHECK(allocator.allocate(VehicleSize::Small, "C")->id() == "L001");
    }
  }

  GIVEN("Only spots that are too small")
  {
    parklot::SpotAllocator allocator(make_store({
        Spot("M001", 1, CapacityClass::SmallOnly),
        Spot("C001", 1, CapacityClass::MediumCapable)
      }));

    THEN("A large vehicle is not allocated a spot")
    {
      CHECK_FALSE(allocator.has_capacity(VehicleSize::Large));
      CHECK_FALSE(allocator.allocate(VehicleSize::Large, "BUS"));

      // Nothing was marked as occupied by the failed attempt
      for (const auto& a : allocator.availability())
        CHECK(a.available == a.total);
    }

    THEN("A medium vehicle never takes a small-only spot")
    {
      CHECK(allocator.allocate(VehicleSize::Medium, "A")->id() == "C001");
      CHECK_FALSE(allocator.allocate(VehicleSize::Medium, "B"));
      CHECK(allocator.has_capacity(VehicleSize::Small));
    }
  }
}

SCENARIO("Test releasing and occupying specific spots")
{
  using parklot::CapacityClass;
  using parklot::Spot;
  using parklot::VehicleSize;

  parklot::SpotAllocator allocator(make_store({
      Spot("M001", 1, CapacityClass::SmallOnly)
    }));

  const auto spot = allocator.allocate(VehicleSize::Small, "MOTO");
  REQUIRE(spot);
  CHECK_FALSE(allocator.has_capacity(VehicleSize::Small));

  WHEN("The spot is released")
  {
    allocator.release(spot->id());
    CHECK(allocator.has_capacity(VehicleSize::Small));

    THEN("Releasing it again is a conflict")
    {
      CHECK_THROWS_AS(
        allocator.release(spot->id()), parklot::spot_conflict_error);
      CHECK(allocator.has_capacity(VehicleSize::Small));
    }

    THEN("It can be occupied directly")
    {
      allocator.occupy("M001", "OTHER");
      CHECK_FALSE(allocator.has_capacity(VehicleSize::Small));
      CHECK_THROWS_AS(
        allocator.occupy("M001", "THIRD"), parklot::spot_conflict_error);
    }
  }

  WHEN("An unknown spot is released")
  {
    CHECK_THROWS_AS(allocator.release("X999"), parklot::spot_not_found_error);
    CHECK_THROWS_AS(
      allocator.occupy("X999", "MOTO"), parklot::spot_not_found_error);
  }

  CHECK_THROWS_AS(
    parklot::SpotAllocator(nullptr), std::invalid_argument);
}

SCENARIO("Test availability reports")
{
  using parklot::CapacityClass;
  using parklot::Spot;
  using parklot::VehicleSize;

  parklot::SpotAllocator allocator(make_store({
      Spot("M001", 2, CapacityClass::SmallOnly),
      Spot("C001", 1, CapacityClass::MediumCapable),
      Spot("C002", 1, CapacityClass::MediumCapable),
      Spot("L001", 1, CapacityClass::LargeCapable),
      Spot("M002", 1, CapacityClass::SmallOnly)
    }));

  REQUIRE(allocator.allocate(VehicleSize::Medium, "CAR"));

  const auto report = allocator.availability();

  THEN("Groups are sorted by floor and then by capacity label")
  {
    using A = parklot::SpotAllocator::Availability;
    const std::vector<A> expected = {
      A{1, CapacityClass::LargeCapable, 1, 1},
      A{1, CapacityClass::MediumCapable, 1, 2},
      A{1, CapacityClass::SmallOnly, 1, 1},
      A{2, CapacityClass::SmallOnly, 1, 1}
    };

    CHECK(report == expected);
  }

  THEN("Repeated reports without changes are identical")
  {
    CHECK(allocator.availability() == report);
    CHECK(allocator.availability() == allocator.availability());
  }

  THEN("A report follows the current state of the spots")
  {
    REQUIRE(allocator.allocate(VehicleSize::Medium, "CAR2"));
    CHECK(allocator.availability() != report);
  }
}

SCENARIO("Test concurrent allocation")
{
  using parklot::CapacityClass;
  using parklot::VehicleSize;

  const std::size_t spot_count = 20;
  const std::size_t vehicle_count = 64;

  auto store = std::make_shared<parklot::SpotStore>();
  for (std::size_t i = 0; i < spot_count; ++i)
  {
    REQUIRE(store->add_spot(
        parklot::Spot(
          "C" + std::to_string(100 + i), 1 + i % 3,
          CapacityClass::MediumCapable)));
  }

  parklot::SpotAllocator allocator(store);

  std::mutex result_mutex;
  std::vector<std::string> allocated;
  std::size_t rejected = 0;

  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < vehicle_count; ++i)
  {
    threads.emplace_back(
      [&, i]()
      {
        const auto spot = allocator.allocate(
          VehicleSize::Medium, "CAR-" + std::to_string(i));

        const std::lock_guard<std::mutex> lock(result_mutex);
        if (spot)
          allocated.push_back(spot->id());
        else
          ++rejected;
      });
  }

  for (auto& t : threads)
    t.join();

  CHECK(allocated.size() == spot_count);
  CHECK(rejected == vehicle_count - spot_count);

  const std::set<std::string> unique(allocated.begin(), allocated.end());
  CHECK(unique.size() == allocated.size());
  CHECK_FALSE(allocator.has_capacity(VehicleSize::Small));
}
