#ifndef __GM_PROCESS_IO_CONTROLLER_H__
#define __GM_PROCESS_IO_CONTROLLER_H__

#include "Headers.hpp"

namespace gm {
/**
 * @brief Structured command/response channel to a debugger process.
 */
class ProcessIoController {
 public:
  virtual ~ProcessIoController() {}

  /**
   * @brief Returns the records that arrived since the last call as a JSON
   * array, or nullopt when there are none. Never blocks.
   * @throws std::runtime_error once the process is gone.
   */
  virtual optional<json> pollResponse() = 0;

  virtual void write(const string& command) = 0;

  /** @brief fd that turns readable when a response may be pending. */
  virtual int getFd() = 0;

  virtual pid_t getPid() = 0;

  /** @brief Kills and reaps the process. Idempotent, never throws. */
  virtual void terminate() = 0;
};
}  // namespace gm

#endif  // __GM_PROCESS_IO_CONTROLLER_H__
