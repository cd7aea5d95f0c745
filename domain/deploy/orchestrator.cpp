#include "orchestrator.hpp"

#include <infrastructure/measure.hpp>

#include <filesystem>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tuple>

namespace dbdock::deploy {

namespace {

using Status = core::Status<OrchestrationError>;

OrchestrationError from_gateway(FailedStep step,
                                const runtime::GatewayError &error,
                                std::string container_id = {}) {
  return OrchestrationError(step, error.serialize(), std::move(container_id),
                            error.status_code());
}

IdentitySource source_for(const host::IdentityError &error) {
  switch (error.kind()) {
  case host::IdentityErrorKind::CliUnavailable:
    return IdentitySource::DefaultCliUnavailable;
  case host::IdentityErrorKind::CommandFailed:
    return IdentitySource::DefaultCommandFailed;
  case host::IdentityErrorKind::UnparsableOutput:
    return IdentitySource::DefaultUnparsableOutput;
  }
  return IdentitySource::DefaultCommandFailed;
}

} // namespace

std::string_view to_string(DeployStage stage) {
  switch (stage) {
  case DeployStage::Requested:
    return "requested";
  case DeployStage::ImagePulled:
    return "image_pulled";
  case DeployStage::UserDiscovered:
    return "user_discovered";
  case DeployStage::StorageReady:
    return "storage_ready";
  case DeployStage::Created:
    return "created";
  case DeployStage::Started:
    return "started";
  case DeployStage::Done:
    return "done";
  }
  return "unknown";
}

std::string_view to_string(FailedStep step) {
  switch (step) {
  case FailedStep::Validate:
    return "validate";
  case FailedStep::Pull:
    return "pull";
  case FailedStep::Discover:
    return "discover";
  case FailedStep::Storage:
    return "storage";
  case FailedStep::Create:
    return "create";
  case FailedStep::Start:
    return "start";
  }
  return "unknown";
}

std::string_view to_string(IdentitySource source) {
  switch (source) {
  case IdentitySource::Discovered:
    return "discovered";
  case IdentitySource::DefaultCliUnavailable:
    return "default_cli_unavailable";
  case IdentitySource::DefaultCommandFailed:
    return "default_command_failed";
  case IdentitySource::DefaultUnparsableOutput:
    return "default_unparsable_output";
  }
  return "unknown";
}

bool DeploymentRun::advance(DeployStage next) {
  if (failed_ ||
      static_cast<int>(next) != static_cast<int>(stage_) + 1) {
    spdlog::error("Refusing deployment transition {} -> {}", to_string(stage_),
                  to_string(next));
    return false;
  }
  stage_ = next;
  return true;
}

Orchestrator::Orchestrator(std::shared_ptr<runtime::RuntimeGateway> gateway,
                           std::shared_ptr<host::IFilesystem> filesystem,
                           std::shared_ptr<host::IIdentityProbe> identity_probe,
                           TemplateCatalog templates, std::string storage_mode)
    : gateway_(std::move(gateway)), filesystem_(std::move(filesystem)),
      identity_probe_(std::move(identity_probe)),
      templates_(std::move(templates)), storage_mode_(std::move(storage_mode)) {}

DeployResult Orchestrator::deploy(const DeploymentRequest &request) const {
  DeploymentRun run;
  return deploy(request, run);
}

DeployResult Orchestrator::deploy(const DeploymentRequest &request,
                                  DeploymentRun &run) const {
  auto fail = [&run](OrchestrationError error) {
    run.fail(error.stage());
    spdlog::error("Deployment failed at {} stage: {}",
                  to_string(error.stage()), error.message());
    return DeployResult::Error(std::move(error));
  };

  if (auto valid = validate(request); !valid) {
    return fail(OrchestrationError(FailedStep::Validate,
                                   valid.error().message()));
  }

  const auto &tmpl = templates_.get(request.engine);
  DeploymentOutcome outcome;
  outcome.container_name = container_name(request);
  outcome.image = image_reference(request, tmpl);

  spdlog::info("Deploying {} as {} on port {}", outcome.image,
               outcome.container_name, request.port);
  core::measure::Stopwatch stopwatch;
  auto mark = [&run, &stopwatch](DeployStage stage) {
    run.advance(stage);
    run.timings_.emplace_back(
        stage, stopwatch.lap_and_log<std::chrono::milliseconds>(
                   fmt::format("{} after {{}} ms", to_string(stage))));
  };

  if (auto pulled = pull(outcome.image); !pulled) {
    return fail(std::move(pulled).error());
  }
  mark(DeployStage::ImagePulled);

  std::tie(outcome.identity, outcome.identity_source) = discover(outcome.image);
  mark(DeployStage::UserDiscovered);

  if (request.wants_storage()) {
    auto storage =
        ensure_storage(normalized_storage_path(*request.storage_path),
                       outcome.identity, outcome.warnings);
    if (!storage) {
      return fail(std::move(storage).error());
    }
  }
  mark(DeployStage::StorageReady);

  auto spec = build_container_spec(request, tmpl);
  auto created = gateway_->create_container(spec);
  if (!created) {
    return fail(from_gateway(FailedStep::Create, created.error()));
  }
  outcome.container_id = created.value().id;
  for (auto &warning : created.value().warnings) {
    outcome.warnings.push_back(std::move(warning));
  }
  run.set_container_id(outcome.container_id);
  mark(DeployStage::Created);
  spdlog::info("Created container {} ({})", outcome.container_name,
               outcome.container_id);

  if (auto started = gateway_->start_container(outcome.container_id);
      !started) {
    return fail(from_gateway(FailedStep::Start, started.error(),
                             outcome.container_id));
  }
  mark(DeployStage::Started);
  mark(DeployStage::Done);

  outcome.final_stage = run.stage();
  spdlog::info("Deployment of {} finished in {} ms", outcome.container_name,
               stopwatch.elapsed<std::chrono::milliseconds>().count());
  return DeployResult::Ok(std::move(outcome));
}

Status Orchestrator::retry_start(const std::string &container_id) const {
  spdlog::info("Retrying start of {}", container_id);
  auto started = gateway_->start_container(container_id);
  if (!started) {
    return Status::Error(
        from_gateway(FailedStep::Start, started.error(), container_id));
  }
  return core::ok_status<OrchestrationError>();
}

Status Orchestrator::pull(const std::string &image) const {
  spdlog::info("Pulling image {}", image);
  auto pulled = gateway_->pull_image(image);
  if (!pulled) {
    return Status::Error(from_gateway(FailedStep::Pull, pulled.error()));
  }
  return core::ok_status<OrchestrationError>();
}

std::pair<host::ImageIdentity, IdentitySource>
Orchestrator::discover(const std::string &image) const {
  auto probed = identity_probe_->probe(image);
  if (probed) {
    const auto &identity = probed.value();
    spdlog::info("Image {} runs as {}:{} ({})", image, identity.uid,
                 identity.gid, identity.user);
    return {identity, IdentitySource::Discovered};
  }

  auto source = source_for(probed.error());
  switch (probed.error().kind()) {
  case host::IdentityErrorKind::CliUnavailable:
    spdlog::warn("No runtime CLI to inspect {}, using uid/gid 1000: {}", image,
                 probed.error().message());
    break;
  case host::IdentityErrorKind::CommandFailed:
    spdlog::warn("Identity probe for {} failed, using uid/gid 1000: {}", image,
                 probed.error().message());
    break;
  case host::IdentityErrorKind::UnparsableOutput:
    spdlog::warn("Unexpected identity output for {}, using uid/gid 1000: {}",
                 image, probed.error().message());
    break;
  }
  return {host::ImageIdentity{}, source};
}

Status Orchestrator::ensure_storage(const std::string &path,
                                    const host::ImageIdentity &identity,
                                    std::vector<std::string> &warnings) const {
  auto info = filesystem_->stat(path);
  if (!info) {
    return Status::Error(
        OrchestrationError(FailedStep::Storage, info.error().serialize()));
  }
  if (info.value().exists) {
    if (!info.value().is_directory) {
      return Status::Error(OrchestrationError(
          FailedStep::Storage,
          fmt::format("storage path {} exists and is not a directory",
                      info.value().path)));
    }
    spdlog::info("Storage path exists: {}", info.value().path);
    return core::ok_status<OrchestrationError>();
  }

  std::filesystem::path target(info.value().path);
  std::string parent = target.parent_path().string();
  std::string leaf = target.filename().string();
  if (leaf.empty()) {
    leaf = "data";
  }
  if (parent.empty()) {
    parent = "/";
  }

  host::MakeDirectoryOptions options;
  options.mode = storage_mode_;
  options.owner = std::to_string(identity.uid);
  options.group = std::to_string(identity.gid);

  spdlog::info("Creating storage directory {} owned by {}:{} ({})",
               info.value().path, identity.uid, identity.gid, identity.user);
  auto made = filesystem_->make_directory(parent, leaf, options);
  if (made) {
    for (const auto &warning : made.value().warnings) {
      warnings.push_back(warning);
    }
    return core::ok_status<OrchestrationError>();
  }
  if (made.error().is(host::FilesystemErrorKind::AlreadyExists)) {
    spdlog::info("Storage path already exists: {}", info.value().path);
    return core::ok_status<OrchestrationError>();
  }
  return Status::Error(
      OrchestrationError(FailedStep::Storage, made.error().serialize()));
}

} // namespace dbdock::deploy
