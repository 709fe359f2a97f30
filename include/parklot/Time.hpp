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

#ifndef PARKLOT__TIME_HPP
#define PARKLOT__TIME_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace parklot {

/// Specifies a specific point in time on the wall clock.
///
/// Entry and exit times are recorded in tickets and in the session journal,
/// so they need to stay meaningful across restarts of the process. That rules
/// out the steady clock.
using Time = std::chrono::system_clock::time_point;

/// Specifies a change in time.
using Duration = std::chrono::system_clock::duration;

/// A source of "now". The session service reads it at check-in and check-out.
using Clock = std::function<Time()>;

namespace time {

/// Change the given duration into a double-precision count of hours,
/// including the fractional part.
double to_hours(Duration delta_t);

/// Change a double-precision count of hours into a duration.
Duration from_hours(double delta_hours);

/// Milliseconds since the Unix Epoch. This is the representation used when
/// a Time is written to disk.
std::int64_t to_epoch_millis(Time t);

/// Inverse of to_epoch_millis()
Time from_epoch_millis(std::int64_t millis);

/// A Clock that reads std::chrono::system_clock
Clock system_clock();

} // namespace time
} // namespace parklot

#endif // PARKLOT__TIME_HPP
