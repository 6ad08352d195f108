#include "skyhost/fleet/compose.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/fleet/secrets.hpp"
#include "skyhost/observability/global.hpp"

#include <sstream>

namespace skyhost::fleet {

namespace {

std::vector<std::string> split_command(const std::string &command) {
  std::vector<std::string> tokens;
  std::istringstream stream(command);
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

// Not logged here: the caller reports the failure.
common::Status orchestration_error(const std::string &message) {
  return common::Status::error(common::ErrorKind::Orchestration, message);
}

} // namespace

ComposeOptions compose_options_from(const config::FleetConfig &fleet) {
  ComposeOptions options{
      .compose_file = fleet.compose_file,
      .secrets_file = fleet.secrets_file,
      .compose_command = fleet.compose_command,
      .docker_command = fleet.docker_command,
      .tool_timeout = std::nullopt,
  };
  if (fleet.tool_timeout_secs > 0) {
    options.tool_timeout =
        std::chrono::seconds(static_cast<std::chrono::seconds::rep>(fleet.tool_timeout_secs));
  }
  return options;
}

ComposeController::ComposeController(ComposeOptions options,
                                     std::map<std::string, std::string> env,
                                     std::shared_ptr<process::ICommandRunner> runner)
    : options_(std::move(options)), env_(std::move(env)), runner_(std::move(runner)) {}

std::vector<std::string>
ComposeController::compose_argv(const std::vector<std::string> &args) const {
  std::vector<std::string> argv = split_command(options_.compose_command);
  argv.push_back("-f");
  argv.push_back(options_.compose_file.string());
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

common::Status ComposeController::require_compose_file() const {
  std::error_code ec;
  if (!std::filesystem::exists(options_.compose_file, ec)) {
    return orchestration_error("compose file not found: " + options_.compose_file.string());
  }
  return common::Status::success();
}

common::Result<process::ProcessResult>
ComposeController::invoke(const std::vector<std::string> &argv,
                          const process::CommandOptions &options, const std::string &action) {
  using InvokeResult = common::Result<process::ProcessResult>;
  if (argv.empty()) {
    const auto status = orchestration_error("compose command is empty");
    return InvokeResult::failure(status.details().value());
  }

  process::CommandOptions effective = options;
  effective.allow_failure = true;
  auto result = runner_->run(argv, effective);
  if (!result.ok()) {
    const auto status = orchestration_error("failed to " + action + ": " + result.error());
    return InvokeResult::failure(status.details().value());
  }

  const auto &outcome = result.value();
  const std::string diagnostic = common::trim(outcome.stderr_text);
  if (outcome.timed_out) {
    const auto status = orchestration_error(
        "failed to " + action + ": " + argv.front() + " timed out" +
        (diagnostic.empty() ? std::string() : ": " + diagnostic));
    return InvokeResult::failure(status.details().value());
  }
  if (outcome.exit_code == process::kExitCommandNotFound) {
    const auto status = orchestration_error(
        argv.front() + " is not installed" +
        (diagnostic.empty() ? std::string() : ": " + diagnostic));
    return InvokeResult::failure(status.details().value());
  }
  if (outcome.exit_code != 0) {
    const auto status = orchestration_error(
        "failed to " + action + " (exit code " + std::to_string(outcome.exit_code) + ")" +
        (diagnostic.empty() ? std::string() : ": " + diagnostic));
    return InvokeResult::failure(status.details().value());
  }
  return result;
}

common::Status ComposeController::start(const std::optional<std::vector<std::string>> &services) {
  if (auto status = require_compose_file(); !status.ok()) {
    return status;
  }

  std::map<std::string, std::string> env = env_;
  const auto secrets = load_secret_env(options_.secrets_file);
  if (!secrets.ok()) {
    return orchestration_error(secrets.error());
  }
  for (const auto &[key, value] : secrets.value()) {
    env[key] = value;
  }

  std::vector<std::string> args = {"up", "-d"};
  if (services.has_value()) {
    args.insert(args.end(), services->begin(), services->end());
  }

  observability::record_lifecycle(
      "start", services.has_value() && !services->empty() ? common::join(*services, ",") : "all");
  const auto result = invoke(compose_argv(args),
                             process::CommandOptions{.timeout = options_.tool_timeout,
                                                     .env = std::move(env),
                                                     .allow_failure = true,
                                                     .echo_output = true},
                             "start services");
  if (!result.ok()) {
    return common::Status::error(result.error_details());
  }
  return common::Status::success();
}

common::Status ComposeController::stop(const bool purge) {
  if (auto status = require_compose_file(); !status.ok()) {
    return status;
  }

  std::vector<std::string> args = {"down"};
  if (purge) {
    args.push_back("-v");
  }

  observability::record_lifecycle(purge ? "purge" : "stop", "all");
  const auto result = invoke(compose_argv(args),
                             process::CommandOptions{.timeout = options_.tool_timeout,
                                                     .env = env_,
                                                     .allow_failure = true,
                                                     .echo_output = true},
                             "stop services");
  if (!result.ok()) {
    return common::Status::error(result.error_details());
  }
  return common::Status::success();
}

common::Status ComposeController::check_dependencies() {
  const process::CommandOptions options{.timeout = options_.tool_timeout,
                                        .env = {},
                                        .allow_failure = true,
                                        .echo_output = false};

  std::vector<std::string> docker_argv = split_command(options_.docker_command);
  docker_argv.push_back("--version");
  if (const auto docker = invoke(docker_argv, options, "check docker"); !docker.ok()) {
    return common::Status::error(common::ErrorKind::Orchestration,
                                 "Docker is not installed or not working: " + docker.error());
  }

  std::vector<std::string> compose = split_command(options_.compose_command);
  compose.push_back("--version");
  if (const auto result = invoke(compose, options, "check compose"); !result.ok()) {
    return common::Status::error(common::ErrorKind::Orchestration,
                                 "Docker Compose is not installed or not working: " +
                                     result.error());
  }
  return common::Status::success();
}

common::Result<Topology> ComposeController::query_topology() {
  if (auto status = require_compose_file(); !status.ok()) {
    return common::Result<Topology>::failure(status.details().value());
  }

  const auto result = invoke(compose_argv({"ps", "--format", "json"}),
                             process::CommandOptions{.timeout = options_.tool_timeout,
                                                     .env = env_,
                                                     .allow_failure = true,
                                                     .echo_output = false},
                             "query service status");
  if (!result.ok()) {
    return common::Result<Topology>::failure(result.error_details());
  }

  Topology topology = parse_topology_listing(result.value().stdout_text);
  if (topology.dropped_records > 0) {
    observability::record_dropped_records(topology.dropped_records);
  }
  return common::Result<Topology>::success(std::move(topology));
}

} // namespace skyhost::fleet
