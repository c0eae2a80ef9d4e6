/**
 * @file signal_manager.h
 * @brief RAII signal handler manager
 */

#ifndef SQLBACKUP_APP_SIGNAL_MANAGER_H_
#define SQLBACKUP_APP_SIGNAL_MANAGER_H_

#include <csignal>
#include <memory>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Signal flags (async-signal-safe)
 *
 * Only sig_atomic_t flags written by the signal handler. Must remain POD.
 */
struct SignalFlags {
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  volatile std::sig_atomic_t shutdown_requested = 0;
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  volatile std::sig_atomic_t received_signal = 0;  ///< First SIGINT/SIGTERM seen
};

/**
 * @brief RAII signal handler manager
 *
 * SIGINT and SIGTERM set a flag that the backup runner and the restore
 * engine poll between tables; the running table finishes (or rolls back)
 * before the operation stops. SIGPIPE is ignored so a dropped server
 * connection surfaces as a query error.
 *
 * Lifecycle:
 * - Create() registers signal handlers
 * - Destructor restores original signal handlers
 */
class SignalManager {
 public:
  /**
   * @brief Construct and register signal handlers
   */
  static Expected<std::unique_ptr<SignalManager>, Error> Create();

  ~SignalManager();

  SignalManager(const SignalManager&) = delete;
  SignalManager& operator=(const SignalManager&) = delete;
  SignalManager(SignalManager&&) = delete;
  SignalManager& operator=(SignalManager&&) = delete;

  /**
   * @brief Check if shutdown was requested (SIGINT/SIGTERM)
   *
   * Reads the flag without resetting it.
   */
  static bool IsShutdownRequested();

  /**
   * @brief Signal that requested the shutdown, 0 if none
   */
  static int ReceivedSignal();

  /**
   * @brief "SIGINT", "SIGTERM" or "signal <n>"
   */
  static std::string SignalName(int signal);

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  static SignalFlags signal_flags_;

 private:
  SignalManager() = default;

  Expected<void, Error> RegisterHandlers();
  void RestoreHandlers();

  struct sigaction original_sigint_ {};
  struct sigaction original_sigterm_ {};
  struct sigaction original_sigpipe_ {};
};

}  // namespace sqlbackup::app

#endif  // SQLBACKUP_APP_SIGNAL_MANAGER_H_
