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


#include <parklot/SpotStore.hpp>

#include <catch2/catch.hpp>

SCENARIO("Test SpotStore")
{
  using parklot::CapacityClass;
  using parklot::VehicleSize;

  parklot::SpotStore store;

  GIVEN("A few spots")
  {
    using parklot::Spot;
    CHECK(store.add_spot(Spot("C002", 1, CapacityClass::MediumCapable)));
    CHECK(store.add_spot(Spot("C001", 1, CapacityClass::MediumCapable)));
    CHECK(store.add_spot(Spot("L001", 2, CapacityClass::LargeCapable)));

    THEN("Spot identifiers are unique")
    {
      CHECK_FALSE(
        store.add_spot(parklot::Spot("C001", 3, CapacityClass::SmallOnly)));
      REQUIRE(store.spot("C001"));
      CHECK(store.spot("C001")->floor() == 1);
    }

    THEN("Spots are listed by identifier")
    {
      const auto spots = store.spots();
      REQUIRE(spots.size() == 3);
      CHECK(spots[0]->id() == "C001");
      CHECK(spots[1]->id() == "C002");
      CHECK(spots[2]->id() == "L001");
    }

    WHEN("A spot is occupied through the store")
    {
      store.spot("C002")->occupy("ABC-123");

      THEN("It is no longer listed as available")
      {
        const auto available = store.available_spots();
        REQUIRE(available.size() == 2);
        CHECK(available[0]->id() == "C001");
        CHECK(available[1]->id() == "L001");
      }
    }

    WHEN("A spot is removed")
    {
      CHECK(store.remove_spot("C002"));
      CHECK_FALSE(store.spot("C002"));
      CHECK(store.spots().size() == 2);
      CHECK_FALSE(store.remove_spot("C002"));
    }

    CHECK_FALSE(store.spot("X999"));
  }

  GIVEN("An active session")
  {
    const parklot::Time now = parklot::time::from_epoch_millis(0);
    REQUIRE(store.add_session(
        parklot::Session(
          1, parklot::Vehicle("ABC-123", VehicleSize::Medium), "C001", now)));

    CHECK_FALSE(store.add_session(
        parklot::Session(
          1, parklot::Vehicle("XYZ-999", VehicleSize::Small), "C002", now)));

    REQUIRE(store.active_session_for_vehicle("ABC-123"));
    CHECK(store.active_session_for_vehicle("ABC-123")->ticket_id() == 1);
    CHECK_FALSE(store.active_session_for_vehicle("XYZ-999"));
    CHECK(store.active_sessions().size() == 1);

    WHEN("The session is removed")
    {
      CHECK(store.remove_session(1));
      CHECK_FALSE(store.session(1));
      CHECK_FALSE(store.active_session_for_vehicle("ABC-123"));
      CHECK(store.sessions().empty());
      CHECK_FALSE(store.remove_session(1));
    }

    WHEN("The session is completed")
    {
      store.session(1)->complete(now, 5.0);
      store.complete_session(1);

      THEN("It is kept as history but is no longer active")
      {
        CHECK_FALSE(store.active_session_for_vehicle("ABC-123"));
        CHECK(store.active_sessions().empty());
        REQUIRE(store.sessions().size() == 1);
        CHECK_FALSE(store.sessions().front()->active());
      }

      THEN("The vehicle can start a new session")
      {
        REQUIRE(store.add_session(
            parklot::Session(
              2, parklot::Vehicle("ABC-123", VehicleSize::Medium), "C002",
              now)));
        REQUIRE(store.active_session_for_vehicle("ABC-123"));
        CHECK(store.active_session_for_vehicle("ABC-123")->ticket_id() == 2);

        // Completing an older ticket again must not unlink the newer one
        store.complete_session(1);
        CHECK(store.active_session_for_vehicle("ABC-123"));
      }
    }
  }
}
