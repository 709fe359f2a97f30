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
#include <parklot/SessionService.hpp>
#include <parklot/errors.hpp>

#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace {

//==============================================================================
/// A clock that starts at the real time and only moves when it is advanced,
/// so the demo can show multi-hour stays without waiting for them.
class SimulatedClock
{
public:

  SimulatedClock()
  : _start(std::chrono::system_clock::now()),
    _offset_ms(0)
  {
    // Do nothing
  }

  void advance(const parklot::Duration dt)
  {
    _offset_ms += std::chrono::duration_cast<std::chrono::milliseconds>(
      dt).count();
  }

  parklot::Clock make_clock()
  {
    return [this]() -> parklot::Time
      {
        return _start + std::chrono::milliseconds(_offset_ms.load());
      };
  }

private:
  parklot::Time _start;
  std::atomic<std::int64_t> _offset_ms;
};

//==============================================================================
void print_availability(const parklot::SessionService& service)
{
  std::cout << "  floor  capacity          available  total\n";
  for (const auto& a : service.availability())
  {
    std::cout << "  " << std::setw(5) << a.floor
              << "  " << std::left << std::setw(16)
              << parklot::to_string(a.capacity) << std::right
              << "  " << std::setw(9) << a.available
              << "  " << std::setw(5) << a.total << "\n";
  }
}

//==============================================================================
void print_session(const parklot::Session& session)
{
  std::cout << "  ticket " << session.ticket_id()
            << " | " << session.vehicle().plate()
            << " (" << parklot::to_string(session.vehicle().size()) << ")"
            << " | spot " << session.spot_id();

  if (const auto fee = session.fee())
  {
    std::ostringstream amount;
    amount << std::fixed << std::setprecision(2) << *fee;
    std::cout << " | fee " << amount.str();
  }

  std::cout << std::endl;
}

//==============================================================================
int run(int argc, char* argv[])
{
  using parklot::Vehicle;
  using parklot::VehicleSize;

  parklot::LotConfig config(
    3,
    {
      {parklot::CapacityClass::SmallOnly, 10},
      {parklot::CapacityClass::MediumCapable, 20},
      {parklot::CapacityClass::LargeCapable, 10}
    });

  if (argc > 1)
    config = parklot::parse_lot_config(std::string(argv[1]));

  SimulatedClock sim;

  parklot::SessionJournalPtr journal;
  if (config.journal_file())
  {
    journal = std::make_unique<parklot::YamlSessionJournal>(
      *config.journal_file());
  }

  const auto store = std::make_shared<parklot::SpotStore>();
  const auto allocator = std::make_shared<parklot::SpotAllocator>(store);
  parklot::SessionService service(
    store, allocator, config.make_fee_calculator(),
    sim.make_clock(), std::move(journal));

  service.initialize(config.floors(), config.spots_per_floor());

  std::cout << "Lot with " << config.floors() << " floors and "
            << config.total_spots() << " spots" << std::endl;
  print_availability(service);

  std::cout << "\nChecking in" << std::endl;
  const std::vector<Vehicle> arrivals = {
    Vehicle("CAR-001", VehicleSize::Medium, std::string("Alice")),
    Vehicle("MOTO-01", VehicleSize::Small),
    Vehicle("TRUCK-1", VehicleSize::Large, std::string("Bob"))
  };

  for (const auto& vehicle : arrivals)
  {
    if (const auto session = service.check_in(vehicle))
      print_session(*session);
    else
      std::cout << "  no spot for " << vehicle.plate() << std::endl;
  }

  try
  {
    service.check_in(arrivals.front());
  }
  catch (const parklot::already_parked_error& e)
  {
    std::cout << "  rejected: " << e.what() << std::endl;
  }

  sim.advance(parklot::time::from_hours(3.5));

  std::cout << "\nChecking out after 3.5 hours" << std::endl;
  for (const auto& vehicle : arrivals)
    print_session(service.check_out(vehicle.plate()));

  try
  {
    service.check_out("GHOST-0");
  }
  catch (const parklot::no_active_session_error& e)
  {
    std::cout << "  rejected: " << e.what() << std::endl;
  }

  std::cout << "\nConcurrent check-ins" << std::endl;
  std::mutex print_mutex;
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < 8; ++i)
  {
    threads.emplace_back(
      [&service, &print_mutex, i]()
      {
        const auto session = service.check_in(
          Vehicle("RUSH-" + std::to_string(i), VehicleSize::Medium));

        const std::lock_guard<std::mutex> lock(print_mutex);
        if (session)
          print_session(*session);
      });
  }

  for (auto& t : threads)
    t.join();

  std::cout << "\nFilling every spot that fits a motorcycle" << std::endl;
  std::size_t parked = 0;
  while (service.has_capacity(VehicleSize::Small))
  {
    const auto session = service.check_in(
      Vehicle("MOTO-" + std::to_string(100 + parked), VehicleSize::Small));
    if (!session)
      break;

    ++parked;
  }

  std::cout << "  parked " << parked << " motorcycles before the lot was full"
            << std::endl;

  const bool rejected =
    !service.check_in(Vehicle("MOTO-LATE", VehicleSize::Small)).has_value();
  std::cout << "  late motorcycle "
            << (rejected ? "was turned away" : "found a spot") << std::endl;

  std::cout << "\nAvailability" << std::endl;
  print_availability(service);

  std::cout << "\n" << service.active_sessions().size() << " active of "
            << service.sessions().size() << " recorded sessions" << std::endl;

  return 0;
}

} // anonymous namespace

//==============================================================================
int main(int argc, char* argv[])
{
  try
  {
    return run(argc, argv);
  }
  catch (const std::exception& e)
  {
    std::cerr << "[parklot_demo] " << e.what() << std::endl;
  }

  return 1;
}
