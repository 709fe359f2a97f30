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

#ifndef PARKLOT__SESSIONJOURNAL_HPP
#define PARKLOT__SESSIONJOURNAL_HPP

#include <parklot/Session.hpp>

#include <parklot/utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <string>

namespace parklot {

//==============================================================================
/// This is the base class for durable records of session transitions.
///
/// The SessionService writes a snapshot of a session each time one is created
/// (an Active snapshot) and each time one is completed (a Completed snapshot).
/// When the lot is initialized, the recorded snapshots are read back in order
/// to restore the sessions and the occupancy of the spots.
class AbstractSessionJournal
{
public:

  /// Called when a session has been created or completed.
  ///
  /// \param[in] session
  ///   Snapshot of the session after the transition
  virtual void write(const Session& session) = 0;

  /// Called when we wish to read the next record during initialization.
  ///
  /// \returns std::nullopt when we have exhausted all records.
  virtual std::optional<Session> read_next() = 0;

  virtual ~AbstractSessionJournal() = default;
};

using SessionJournalPtr = std::unique_ptr<AbstractSessionJournal>;

//==============================================================================
/// Journal that appends every snapshot to a YAML file on disk.
class YamlSessionJournal : public AbstractSessionJournal
{
public:

  /// Constructor
  ///
  /// Loads previously recorded snapshots from the file if it exists, and
  /// appends new ones to it.
  ///
  /// \throws YAML::ParserException if there is an error in the syntax of the
  /// journal file, or if its root is not a sequence.
  ///
  /// \throws YAML::BadFile if there are problems with reading the file.
  ///
  /// \throws std::filesystem::filesystem_error if the directory of the file
  /// cannot be created.
  YamlSessionJournal(std::string file_path);

  /// See AbstractSessionJournal
  ///
  /// A failure to open the file is reported on std::cerr and otherwise
  /// ignored, so the in-memory state stays authoritative.
  void write(const Session& session) override;

  /// See AbstractSessionJournal
  ///
  /// \throws std::runtime_error if a record in the file is malformed.
  std::optional<Session> read_next() override;

  class Implementation;
private:
  utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace parklot

#endif // PARKLOT__SESSIONJOURNAL_HPP
