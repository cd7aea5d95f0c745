#ifndef DBDOCK_DEPLOY_ORCHESTRATOR_HPP
#define DBDOCK_DEPLOY_ORCHESTRATOR_HPP

#include "engine.hpp"
#include "request.hpp"

#include <host/filesystem.hpp>
#include <host/identity_probe.hpp>
#include <infrastructure/result.hpp>
#include <runtime/gateway.hpp>
#include <utils/error.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dbdock::deploy {

// Linear progression; no back edges.
enum class DeployStage {
  Requested,
  ImagePulled,
  UserDiscovered,
  StorageReady,
  Created,
  Started,
  Done
};

// The step that was running when a run failed.
enum class FailedStep { Validate, Pull, Discover, Storage, Create, Start };

std::string_view to_string(DeployStage stage);
std::string_view to_string(FailedStep step);

enum class IdentitySource {
  Discovered,
  DefaultCliUnavailable,
  DefaultCommandFailed,
  DefaultUnparsableOutput
};

std::string_view to_string(IdentitySource source);

class OrchestrationError : public core::utils::Error<FailedStep> {
public:
  OrchestrationError(FailedStep stage, std::string message,
                     std::string container_id = {}, int cause_status = 0)
      : Error(stage, std::move(message)),
        container_id_(std::move(container_id)), cause_status_(cause_status) {}

  FailedStep stage() const { return kind(); }
  // Set once the container exists, i.e. for Start failures.
  const std::string &container_id() const { return container_id_; }
  // Runtime HTTP status behind the failure, 0 if there was none.
  int cause_status() const { return cause_status_; }

  bool retryable_start() const { return kind() == FailedStep::Start; }

private:
  std::string container_id_;
  int cause_status_;
};

class DeploymentRun {
public:
  DeployStage stage() const { return stage_; }
  std::optional<FailedStep> failed_stage() const { return failed_; }
  bool failed() const { return failed_.has_value(); }
  bool done() const { return stage_ == DeployStage::Done; }

  // The container exists but the start step did not succeed.
  bool created_but_not_started() const {
    return stage_ == DeployStage::Created && failed_ == FailedStep::Start;
  }

  const std::string &container_id() const { return container_id_; }

  // Moves to the direct successor only. Returns false (and changes nothing)
  // for anything else, including after a failure.
  bool advance(DeployStage next);
  void fail(FailedStep step) {
    if (!failed_) {
      failed_ = step;
    }
  }
  void set_container_id(std::string id) { container_id_ = std::move(id); }

  const std::vector<std::pair<DeployStage, std::chrono::milliseconds>> &
  timings() const {
    return timings_;
  }

private:
  DeployStage stage_ = DeployStage::Requested;
  std::optional<FailedStep> failed_;
  std::string container_id_;
  std::vector<std::pair<DeployStage, std::chrono::milliseconds>> timings_;

  friend class Orchestrator;
};

struct DeploymentOutcome {
  std::string container_id;
  std::string container_name;
  std::string image;
  host::ImageIdentity identity;
  IdentitySource identity_source = IdentitySource::Discovered;
  std::vector<std::string> warnings;
  DeployStage final_stage = DeployStage::Requested;
};

using DeployResult = core::Result<DeploymentOutcome, OrchestrationError>;

class Orchestrator {
public:
  Orchestrator(std::shared_ptr<runtime::RuntimeGateway> gateway,
               std::shared_ptr<host::IFilesystem> filesystem,
               std::shared_ptr<host::IIdentityProbe> identity_probe,
               TemplateCatalog templates, std::string storage_mode = "755");

  DeployResult deploy(const DeploymentRequest &request) const;
  // Same, with the run state left in `run` for the caller to inspect.
  DeployResult deploy(const DeploymentRequest &request,
                      DeploymentRun &run) const;

  // Re-issues only the start step for a container left created but not
  // started.
  core::Status<OrchestrationError>
  retry_start(const std::string &container_id) const;

  const TemplateCatalog &templates() const { return templates_; }

private:
  core::Status<OrchestrationError> pull(const std::string &image) const;
  std::pair<host::ImageIdentity, IdentitySource>
  discover(const std::string &image) const;
  core::Status<OrchestrationError>
  ensure_storage(const std::string &path, const host::ImageIdentity &identity,
                 std::vector<std::string> &warnings) const;

  std::shared_ptr<runtime::RuntimeGateway> gateway_;
  std::shared_ptr<host::IFilesystem> filesystem_;
  std::shared_ptr<host::IIdentityProbe> identity_probe_;
  TemplateCatalog templates_;
  std::string storage_mode_;
};

} // namespace dbdock::deploy

#endif // DBDOCK_DEPLOY_ORCHESTRATOR_HPP
