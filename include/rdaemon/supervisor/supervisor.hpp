#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"
#include "rdaemon/core/error.hpp"
#include "rdaemon/daemon/daemon.hpp"
#include "rdaemon/process/process.hpp"
#include "rdaemon/supervisor/supervision_context.hpp"

#include <memory>
#include <string>

namespace rdaemon {

// Owns one daemon for the lifetime of its process: detaches and records it,
// runs it, and makes sure the exit cleanups (terminate, then release the
// bookkeeping record) run however run() ends. Termination signals are
// turned into terminate() by a watcher thread.
class DaemonSupervisor final : public IDaemon {
public:
  DaemonSupervisor(SupervisionContext& context, std::string name,
                   std::unique_ptr<IDaemon> daemon);

  DaemonSupervisor(const DaemonSupervisor&) = delete;
  auto operator=(const DaemonSupervisor&) -> DaemonSupervisor& = delete;

  // Detaches the calling process, records it under key and registers the
  // release of the record with context. Returns only in the detached daemon,
  // except when the backend fails before detaching. bookkeeping must outlive
  // the context. Build the daemon afterwards: threads do not survive fork.
  [[nodiscard]] static auto daemonize(SupervisionContext& context,
                                      Bookkeeping& bookkeeping,
                                      const DaemonKey& key,
                                      const process::DetachOptions& detach = {})
      -> Result<void>;

  // Runs the daemon to completion and returns the process exit code.
  [[nodiscard]] auto supervise() -> int;

  auto run() -> void override;
  auto notify() -> void override;
  auto terminate() -> void override;
  [[nodiscard]] auto is_terminated() const -> bool override;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }

private:
  SupervisionContext& context_;
  std::string name_;
  std::unique_ptr<IDaemon> daemon_;
};

}  // namespace rdaemon
