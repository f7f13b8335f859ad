#ifndef sesh_log_sink_hpp
#define sesh_log_sink_hpp
//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.

#include <sesh/log_severity.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <utility>

namespace sesh {

/**
 * A destination for logging messages.
 *
 * Applications configure where sesh messages go by adding one or more instances of sesh::log_sink to the global
 * logger.  Sinks are called from whatever thread produced the message, often a batch worker, so implementations must
 * be thread-safe.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /**
   * Log the given message to the sink.
   *
   * @param sev the severity of the message.
   * @param message the message value.
   */
  virtual void log(severity sev, std::string&& message) = 0;
};

/**
 * An adaptor that converts any Functor into a @c sesh::log_sink.
 *
 * @tparam Functor the type of the functor to adapt.
 */
template <typename Functor>
class log_to_functor : public log_sink {
public:
  log_to_functor(Functor&& f)
      : functor(std::move(f)) {
  }

  /// Forward logging to the functor.
  void log(severity sev, std::string&& message) override {
    functor(sev, std::move(message));
  }

private:
  Functor functor;
};

/**
 * Create a @c sesh::log_sink shared pointer from a functor.
 *
 * @tparam Functor the type of the functor object @a f.
 * @param f the functor object to forward calls to.
 * @return a log_sink that forwards log() calls to the given functor @a f.
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<log_to_functor<functor_type>>(functor_type(std::forward<Functor>(f)));
}

/**
 * Create a sink that writes one line per message to @a os.
 *
 * Writes are serialized, lines from concurrent batch workers do not interleave.  The stream must outlive the sink.
 */
std::shared_ptr<log_sink> make_stream_sink(std::ostream& os);

} // namespace sesh

#endif // sesh_log_sink_hpp
