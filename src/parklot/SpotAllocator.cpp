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

#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace parklot {

//==============================================================================
bool SpotAllocator::Availability::operator==(const Availability& other) const
{
  return floor == other.floor
    && capacity == other.capacity
    && available == other.available
    && total == other.total;
}

//==============================================================================
bool SpotAllocator::Availability::operator!=(const Availability& other) const
{
  return !(*this == other);
}

//==============================================================================
class SpotAllocator::Implementation
{
public:

  Implementation(SpotStorePtr store_)
  : store(std::move(store_))
  {
    if (!store)
    {
      throw std::invalid_argument(
        "[parklot::SpotAllocator] A nullptr was given for the SpotStore");
    }
  }

  //============================================================================
  std::optional<Spot> allocate(
    const VehicleSize size,
    const std::string& vehicle_id)
  {
    const std::lock_guard<std::mutex> lock(mutex);

    Spot* best = nullptr;
    for (Spot* candidate : store->available_spots())
    {
      if (!candidate->fits(size))
        continue;

      if (!best || closer_to_entrance(*candidate, *best))
        best = candidate;
    }

    if (!best)
      return std::nullopt;

    best->occupy(vehicle_id);
    return *best;
  }

  //============================================================================
  void release(const std::string& spot_id)
  {
    const std::lock_guard<std::mutex> lock(mutex);
    find("SpotAllocator::release", spot_id).release();
  }

  //============================================================================
  void occupy(const std::string& spot_id, const std::string& vehicle_id)
  {
    const std::lock_guard<std::mutex> lock(mutex);
    find("SpotAllocator::occupy", spot_id).occupy(vehicle_id);
  }

  //============================================================================
  std::vector<Availability> availability() const
  {
    const std::lock_guard<std::mutex> lock(mutex);

    // Keyed by (floor, capacity label) so that iteration yields the report
    // order directly.
    std::map<std::pair<std::size_t, std::string>, Availability> summary;
    for (const Spot* spot : store->spots())
    {
      const auto key =
        std::make_pair(spot->floor(), to_string(spot->capacity()));
      auto insertion = summary.insert(
        {key, Availability{spot->floor(), spot->capacity(), 0, 0}});

      Availability& entry = insertion.first->second;
      ++entry.total;
      if (spot->available())
        ++entry.available;
    }

    std::vector<Availability> output;
    output.reserve(summary.size());
    for (const auto& element : summary)
      output.push_back(element.second);

    return output;
  }

  //============================================================================
  bool has_capacity(const VehicleSize size) const
  {
    const std::lock_guard<std::mutex> lock(mutex);
    const auto available = store->available_spots();
    return std::any_of(available.begin(), available.end(),
        [size](const Spot* spot) { return spot->fits(size); });
  }

private:

  //============================================================================
  static bool closer_to_entrance(const Spot& a, const Spot& b)
  {
    if (a.floor() != b.floor())
      return a.floor() < b.floor();

    return a.id() < b.id();
  }

  //============================================================================
  Spot& find(const std::string& source, const std::string& spot_id)
  {
    Spot* spot = store->spot(spot_id);
    if (!spot)
      throw spot_not_found_error(source, spot_id);

    return *spot;
  }

  SpotStorePtr store;
  mutable std::mutex mutex;
};

//==============================================================================
SpotAllocator::SpotAllocator(SpotStorePtr store)
: _pimpl(utils::make_unique_impl<Implementation>(std::move(store)))
{
  // Do nothing
}

//==============================================================================
std::optional<Spot> SpotAllocator::allocate(
  const VehicleSize size,
  const std::string& vehicle_id)
{
  return _pimpl->allocate(size, vehicle_id);
}

//==============================================================================
void SpotAllocator::release(const std::string& spot_id)
{
  _pimpl->release(spot_id);
}

//==============================================================================
void SpotAllocator::occupy(
  const std::string& spot_id,
  const std::string& vehicle_id)
{
  _pimpl->occupy(spot_id, vehicle_id);
}

//==============================================================================
auto SpotAllocator::availability() const -> std::vector<Availability>
{
  return _pimpl->availability();
}

//==============================================================================
bool SpotAllocator::has_capacity(const VehicleSize size) const
{
  return _pimpl->has_capacity(size);
}

} // namespace parklot
