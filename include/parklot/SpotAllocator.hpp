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

#ifndef PARKLOT__SPOTALLOCATOR_HPP
#define PARKLOT__SPOTALLOCATOR_HPP

#include <parklot/Spot.hpp>
#include <parklot/SpotStore.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parklot {

//==============================================================================
/// Matches vehicles to spots and keeps track of which spots are free.
///
/// Every operation is serialized by one lock that is held for the full
/// duration of the operation, so two allocations can never select the same
/// spot and an availability report never observes a half-updated spot.
///
/// The allocator never calls into the SessionService. Callers that hold the
/// session lock may call into the allocator, but not the other way around.
class SpotAllocator
{
public:

  /// Point-in-time count of the spots of one capacity class on one floor.
  struct Availability
  {
    std::size_t floor;
    CapacityClass capacity;
    std::size_t available;
    std::size_t total;

    bool operator==(const Availability& other) const;
    bool operator!=(const Availability& other) const;
  };

  /// Constructor
  ///
  /// \param[in] store
  ///   The store that holds the spots of the lot.
  SpotAllocator(SpotStorePtr store);

  /// Allocate a spot for a vehicle.
  ///
  /// Among the available spots that fit the vehicle, the one on the lowest
  /// floor is chosen. Ties are broken by the lexicographic order of the spot
  /// identifiers.
  ///
  /// \param[in] size
  ///   The size class of the vehicle
  ///
  /// \param[in] vehicle_id
  ///   The plate of the vehicle, which becomes the occupant of the spot
  ///
  /// \return a snapshot of the spot that was allocated, or std::nullopt if no
  /// compatible spot is available. Running out of spots is not an error.
  std::optional<Spot> allocate(VehicleSize size, const std::string& vehicle_id);

  /// Make a spot available again.
  ///
  /// \throws spot_not_found_error if there is no spot with this identifier.
  ///
  /// \throws spot_conflict_error if the spot is already available.
  void release(const std::string& spot_id);

  /// Mark a specific spot as occupied. This bypasses the allocation policy and
  /// is meant for restoring a previously recorded state.
  ///
  /// \throws spot_not_found_error if there is no spot with this identifier.
  ///
  /// \throws spot_conflict_error if the spot is already occupied.
  void occupy(const std::string& spot_id, const std::string& vehicle_id);

  /// Count the available and total spots, grouped by floor and capacity class,
  /// and sorted by floor and then by capacity class label. This is recomputed
  /// from the current state of the spots on every call.
  std::vector<Availability> availability() const;

  /// True if at least one spot that fits the given size is available.
  bool has_capacity(VehicleSize size) const;

  class Implementation;
private:
  utils::unique_impl_ptr<Implementation> _pimpl;
};

using SpotAllocatorPtr = std::shared_ptr<SpotAllocator>;

} // namespace parklot

#endif // PARKLOT__SPOTALLOCATOR_HPP
