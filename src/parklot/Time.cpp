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

#include <parklot/Time.hpp>

namespace parklot {
namespace time {

//==============================================================================
double to_hours(const Duration delta_t)
{
  using Hours = std::chrono::duration<double, std::ratio<3600>>;
  return std::chrono::duration_cast<Hours>(delta_t).count();
}

//==============================================================================
Duration from_hours(const double delta_hours)
{
  using Hours = std::chrono::duration<double, std::ratio<3600>>;
  return std::chrono::duration_cast<Duration>(Hours(delta_hours));
}

//==============================================================================
std::int64_t to_epoch_millis(const Time t)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    t.time_since_epoch()).count();
}

//==============================================================================
Time from_epoch_millis(const std::int64_t millis)
{
  return Time(std::chrono::duration_cast<Duration>(
      std::chrono::milliseconds(millis)));
}

//==============================================================================
Clock system_clock()
{
  return []() { return std::chrono::system_clock::now(); };
}

} // namespace time
} // namespace parklot
