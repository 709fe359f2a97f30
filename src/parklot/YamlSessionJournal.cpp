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

#include "internal_YamlSerialization.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace parklot {

//==============================================================================
class YamlSessionJournal::Implementation
{
public:

  Implementation(std::string file_path)
  : _file_path(std::move(file_path)),
    _counter(0)
  {
    if (!std::filesystem::exists(_file_path))
    {
      const auto directory =
        std::filesystem::absolute(_file_path).parent_path();
      std::filesystem::create_directories(directory);
      return;
    }

    _buffer = YAML::LoadFile(_file_path);
    if (_buffer.IsNull())
    {
      // An empty file is a journal with no records
      return;
    }

    if (!_buffer.IsSequence())
    {
      // Malformatted YAML. Failing so that we don't corrupt data
      throw YAML::ParserException(_buffer.Mark(),
        "Malformatted journal [" + _file_path + "] - Expected the root of "
        "the document to be a yaml sequence");
    }
  }

  void write(const Session& session)
  {
    const std::lock_guard<std::mutex> lock(_mutex);

    // A block sequence can be appended to without rewriting the file, so we
    // only need to write the newest record.
    YAML::Emitter emitter;
    emitter << YAML::BeginSeq;
    emitter << serialize(session);
    emitter << YAML::EndSeq;

    std::ofstream outfile(_file_path, std::ofstream::out | std::ofstream::app);
    if (!outfile.is_open() || !emitter.good())
    {
      std::cerr << "[parklot::YamlSessionJournal] Unable to append ticket ["
                << session.ticket_id() << "] to journal [" << _file_path
                << "]. The session will not survive a restart." << std::endl;
      return;
    }

    outfile << emitter.c_str() << std::endl;
  }

  std::optional<Session> read_next()
  {
    if (!_buffer.IsSequence() || _counter >= _buffer.size())
    {
      // We have reached the end of the file, restoration is complete.
      return std::nullopt;
    }

    return session(_buffer[_counter++]);
  }

private:
  std::string _file_path;
  YAML::Node _buffer; // used when loading the file
  std::size_t _counter;
  std::mutex _mutex;
};

//==============================================================================
YamlSessionJournal::YamlSessionJournal(std::string file_path)
: _pimpl(utils::make_unique_impl<Implementation>(std::move(file_path)))
{
  // Do nothing
}

//==============================================================================
void YamlSessionJournal::write(const Session& session)
{
  _pimpl->write(session);
}

//==============================================================================
std::optional<Session> YamlSessionJournal::read_next()
{
  return _pimpl->read_next();
}

} // namespace parklot
