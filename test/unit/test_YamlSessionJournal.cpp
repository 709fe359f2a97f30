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


#include <parklot/SessionJournal.hpp>

#include "parklot/internal_YamlSerialization.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

SCENARIO("Test serializing sessions")
{
  using namespace std::chrono_literals;

  const parklot::Time entry = parklot::time::from_epoch_millis(1600000000123);
  parklot::Session session(
    3,
    parklot::Vehicle(
      "ABC-123", parklot::VehicleSize::Medium, std::string("Alice")),
    "C002",
    entry);

  WHEN("The session is active")
  {
    const auto result = parklot::session(parklot::serialize(session));
    CHECK(result.ticket_id() == 3);
    CHECK(result.vehicle().plate() == "ABC-123");
    CHECK(result.vehicle().size() == parklot::VehicleSize::Medium);
    REQUIRE(result.vehicle().owner());
    CHECK(*result.vehicle().owner() == "Alice");
    CHECK(result.spot_id() == "C002");
    CHECK(result.entry_time() == entry);
    CHECK(result.active());
  }

  WHEN("The session is completed")
  {
    session.complete(entry + 90min, 7.5);
    const auto result = parklot::session(parklot::serialize(session));
    CHECK_FALSE(result.active());
    REQUIRE(result.exit_time());
    CHECK(*result.exit_time() == entry + 90min);
    REQUIRE(result.fee());
    CHECK(*result.fee() == 7.5);
  }

  WHEN("A record is missing a key")
  {
    YAML::Node node = parklot::serialize(session);
    node.remove("spot");
    CHECK_THROWS_AS(parklot::session(node), YAML::ParserException);
  }

  WHEN("A record has an exit time but no fee")
  {
    YAML::Node node = parklot::serialize(session);
    node["exit_ms"] = 1600000000999;
    CHECK_THROWS_AS(parklot::session(node), YAML::ParserException);
  }

  WHEN("A record has an unknown vehicle size")
  {
    YAML::Node node = parklot::serialize(session);
    node["vehicle"]["size"] = "tank";
    CHECK_THROWS_AS(parklot::session(node), YAML::ParserException);
  }
}

SCENARIO("Test YamlSessionJournal")
{
  using namespace std::chrono_literals;

  const std::filesystem::path directory =
    std::filesystem::temp_directory_path() / "parklot_test_journal";
  const std::filesystem::path file = directory / "journal.yaml";
  std::filesystem::remove_all(directory);

  const parklot::Time entry = parklot::time::from_epoch_millis(1600000000000);
  parklot::Session car(
    1, parklot::Vehicle("CAR-1", parklot::VehicleSize::Medium), "C001", entry);
  const parklot::Session moto(
    2, parklot::Vehicle("MOTO-1", parklot::VehicleSize::Small), "M001", entry);

  {
    parklot::YamlSessionJournal journal(file.string());
    CHECK(std::filesystem::exists(directory));
    CHECK_FALSE(journal.read_next());

    journal.write(car);
    journal.write(moto);
    car.complete(entry + 2h, 7.5);
    journal.write(car);
  }

  GIVEN("The journal is opened again")
  {
    parklot::YamlSessionJournal journal(file.string());

    THEN("The records are read back in order")
    {
      const auto first = journal.read_next();
      REQUIRE(first);
      CHECK(first->ticket_id() == 1);
      CHECK(first->active());

      const auto second = journal.read_next();
      REQUIRE(second);
      CHECK(second->vehicle().plate() == "MOTO-1");

      const auto third = journal.read_next();
      REQUIRE(third);
      CHECK(third->ticket_id() == 1);
      CHECK_FALSE(third->active());
      REQUIRE(third->fee());
      CHECK(*third->fee() == 7.5);

      CHECK_FALSE(journal.read_next());
    }
  }

  GIVEN("A journal file whose root is not a sequence")
  {
    {
      std::ofstream out(file);
      out << "ticket: 1\n";
    }

    CHECK_THROWS_AS(
      parklot::YamlSessionJournal(file.string()), YAML::ParserException);
  }

  std::filesystem::remove_all(directory);
}
