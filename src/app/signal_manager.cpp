/**
 * @file signal_manager.cpp
 * @brief RAII signal handler manager implementation
 */

#include "app/signal_manager.h"

#include <cerrno>
#include <cstring>  // for memset, strerror
#include <string>

namespace sqlbackup::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
SignalFlags SignalManager::signal_flags_;

namespace {

/**
 * @brief Async-signal-safe signal handler
 *
 * Only sets the flag: no locks, no allocation, no logging.
 */
void SignalHandlerFunction(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (SignalManager::signal_flags_.received_signal == 0) {
      SignalManager::signal_flags_.received_signal = signal;
    }
    SignalManager::signal_flags_.shutdown_requested = 1;
  }
}

}  // namespace

Expected<std::unique_ptr<SignalManager>, Error> SignalManager::Create() {
  auto manager = std::unique_ptr<SignalManager>(new SignalManager());

  auto register_result = manager->RegisterHandlers();
  if (!register_result) {
    return MakeUnexpected(register_result.error());
  }

  return manager;
}

SignalManager::~SignalManager() {
  RestoreHandlers();
}

bool SignalManager::IsShutdownRequested() {  // static
  return signal_flags_.shutdown_requested != 0;
}

int SignalManager::ReceivedSignal() {  // static
  return static_cast<int>(signal_flags_.received_signal);
}

std::string SignalManager::SignalName(int signal) {  // static
  switch (signal) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal " + std::to_string(signal);
  }
}

Expected<void, Error> SignalManager::RegisterHandlers() {
  struct sigaction sig_action {};
  std::memset(&sig_action, 0, sizeof(sig_action));
  sig_action.sa_handler = SignalHandlerFunction;
  sigemptyset(&sig_action.sa_mask);
  sig_action.sa_flags = 0;

  if (sigaction(SIGINT, &sig_action, &original_sigint_) != 0) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError,
                                    "Failed to register SIGINT handler: " + std::string(std::strerror(errno))));
  }

  if (sigaction(SIGTERM, &sig_action, &original_sigterm_) != 0) {
    sigaction(SIGINT, &original_sigint_, nullptr);
    return MakeUnexpected(MakeError(ErrorCode::kInternalError,
                                    "Failed to register SIGTERM handler: " + std::string(std::strerror(errno))));
  }

  // Writes to a connection the server closed must not kill the process
  struct sigaction sigpipe_action {};
  std::memset(&sigpipe_action, 0, sizeof(sigpipe_action));
  sigpipe_action.sa_handler = SIG_IGN;
  sigemptyset(&sigpipe_action.sa_mask);
  sigpipe_action.sa_flags = 0;

  if (sigaction(SIGPIPE, &sigpipe_action, &original_sigpipe_) != 0) {
    sigaction(SIGINT, &original_sigint_, nullptr);
    sigaction(SIGTERM, &original_sigterm_, nullptr);
    return MakeUnexpected(MakeError(ErrorCode::kInternalError,
                                    "Failed to register SIGPIPE handler: " + std::string(std::strerror(errno))));
  }

  return {};
}

void SignalManager::RestoreHandlers() {
  // Best effort
  sigaction(SIGINT, &original_sigint_, nullptr);
  sigaction(SIGTERM, &original_sigterm_, nullptr);
  sigaction(SIGPIPE, &original_sigpipe_, nullptr);
}

}  // namespace sqlbackup::app
