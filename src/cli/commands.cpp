#include "skyhost/cli/commands.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/config/config.hpp"
#include "skyhost/doctor/diagnostics.hpp"
#include "skyhost/fleet/catalog.hpp"
#include "skyhost/fleet/compose.hpp"
#include "skyhost/health/health.hpp"
#include "skyhost/observability/factory.hpp"
#include "skyhost/observability/global.hpp"
#include "skyhost/readiness/readiness.hpp"
#include "skyhost/status/status.hpp"

#include <optional>

namespace skyhost::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_flag(std::vector<std::string> &args, const std::string &name,
               const std::string &short_name = "") {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config" || args[i] == "-c") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

// Anything still looking like an option after the known flags were taken.
bool reject_unknown_options(const std::vector<std::string> &args, const CliDependencies &deps) {
  for (const auto &arg : args) {
    if (common::starts_with(arg, "-")) {
      *deps.err << "Error: unknown option: " << arg << "\n";
      return true;
    }
  }
  return false;
}

int report_error(const CliDependencies &deps, const std::string &message) {
  *deps.err << "Error: " << message << "\n";
  return 1;
}

std::optional<config::Config> load_checked_config(const CliDependencies &deps) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    (void)report_error(deps, loaded.error());
    return std::nullopt;
  }
  const auto validation = config::validate_config(loaded.value());
  if (!validation.ok()) {
    (void)report_error(deps, validation.error());
    return std::nullopt;
  }

  if (deps.install_observer) {
    observability::set_global_observer(
        observability::create_observer(loaded.value().observability));
  }
  for (const auto &warning : validation.value()) {
    observability::record_config_warning(warning);
  }
  return loaded.value();
}

std::shared_ptr<fleet::ComposeController> make_compose(const config::Config &config,
                                                       const CliDependencies &deps) {
  return std::make_shared<fleet::ComposeController>(fleet::compose_options_from(config.fleet),
                                                    config::env_vars(config), deps.runner);
}

std::shared_ptr<health::HealthChecker> make_health_checker(const config::Config &config,
                                                           const CliDependencies &deps) {
  return std::make_shared<health::HealthChecker>(
      health::HealthCheckerOptions{.domain = config.network.domain,
                                   .base_url = config.probes.base_url,
                                   .timeout_ms = config.probes.timeout_ms},
      deps.http);
}

int run_start(std::vector<std::string> args, const CliDependencies &deps) {
  const bool no_deps = take_flag(args, "--no-deps");
  if (reject_unknown_options(args, deps)) {
    return 1;
  }
  const auto config = load_checked_config(deps);
  if (!config.has_value()) {
    return 1;
  }

  auto compose = make_compose(*config, deps);
  if (!no_deps) {
    if (const auto status = compose->check_dependencies(); !status.ok()) {
      return report_error(deps, status.error());
    }
  }

  std::optional<std::vector<std::string>> services;
  if (!args.empty()) {
    services = args;
  }
  if (const auto status = compose->start(services); !status.ok()) {
    return report_error(deps, status.error());
  }
  *deps.out << "Services started successfully!\n";
  return 0;
}

int run_stop(std::vector<std::string> args, const CliDependencies &deps) {
  const bool clean = take_flag(args, "--clean");
  const bool yes = take_flag(args, "--yes", "-y");
  if (reject_unknown_options(args, deps)) {
    return 1;
  }
  if (!args.empty()) {
    return report_error(deps, "stop does not take arguments");
  }
  const auto config = load_checked_config(deps);
  if (!config.has_value()) {
    return 1;
  }

  if (clean && !yes) {
    *deps.out << "This will stop all services and delete their data volumes.\n"
              << "Type 'yes' to continue: ";
    deps.out->flush();
    std::string answer;
    std::getline(*deps.in, answer);
    if (common::trim(answer) != "yes") {
      *deps.out << "Aborted.\n";
      return 1;
    }
  }

  auto compose = make_compose(*config, deps);
  if (const auto status = compose->stop(clean); !status.ok()) {
    return report_error(deps, status.error());
  }
  *deps.out << "Services stopped successfully!\n";
  return 0;
}

int run_status(std::vector<std::string> args, const CliDependencies &deps) {
  const bool verbose = take_flag(args, "--verbose", "-v");
  const bool json = take_flag(args, "--json");
  const bool probe = take_flag(args, "--health");
  if (reject_unknown_options(args, deps)) {
    return 1;
  }
  const auto config = load_checked_config(deps);
  if (!config.has_value()) {
    return 1;
  }

  status::StatusManager manager(make_compose(*config, deps),
                                probe ? make_health_checker(*config, deps) : nullptr);
  const auto snapshot =
      manager.snapshot(status::SnapshotOptions{.verbose = verbose, .probe_health = probe});
  if (!snapshot.ok()) {
    return report_error(deps, snapshot.error());
  }

  if (json) {
    *deps.out << status::status_json(snapshot.value()) << "\n";
  } else {
    status::print_status(*deps.out, snapshot.value(), verbose);
  }
  return 0;
}

int run_health(std::vector<std::string> args, const CliDependencies &deps) {
  const bool verbose = take_flag(args, "--verbose", "-v");
  if (reject_unknown_options(args, deps)) {
    return 1;
  }
  const auto config = load_checked_config(deps);
  if (!config.has_value()) {
    return 1;
  }

  std::vector<std::string> services = args;
  if (services.empty()) {
    for (const auto service : fleet::kAllServices) {
      services.emplace_back(fleet::to_string(service));
    }
  }

  const auto checker = make_health_checker(*config, deps);
  for (const auto &status : checker->check_services(services)) {
    health::print_health_status(*deps.out, status, verbose);
  }
  return 0;
}

int run_check(std::vector<std::string> args, const CliDependencies &deps) {
  const bool no_dns = take_flag(args, "--no-dns");
  const bool no_docker = take_flag(args, "--no-docker");
  if (reject_unknown_options(args, deps)) {
    return 1;
  }
  const auto config = load_checked_config(deps);
  if (!config.has_value()) {
    return 1;
  }
  if (const auto status = doctor::check_prerequisites(*config); !status.ok()) {
    return report_error(deps, status.error());
  }

  const readiness::ReadinessGate gate(
      readiness::ReadinessOptions{.timeout_ms = config->probes.timeout_ms,
                                  .dns_timeout_secs = config->probes.dns_timeout_secs,
                                  .dig_command = "dig"},
      deps.runner, deps.http, deps.websocket);
  auto compose = make_compose(*config, deps);

  const auto report = doctor::run_diagnostics(
      *config, doctor::DiagnosticsOptions{.skip_dns = no_dns, .skip_docker = no_docker}, gate,
      *compose);
  doctor::print_diagnostics_report(*deps.out, report);
  if (!report.ok()) {
    return 1;
  }
  *deps.out << "Environment check completed successfully!\n";
  return 0;
}

void print_help(std::ostream &out) {
  out << "\n";
  out << "  skyhost - self-hosted AT Protocol service manager\n";
  out << "  " << version_string() << "\n\n";

  out << "  USAGE\n";
  out << "  $ skyhost [--config PATH] <command> [options]\n\n";

  out << "  LIFECYCLE\n";
  out << "  start [--no-deps] [SERVICE...]     Start all services or the listed ones\n";
  out << "  stop [--clean] [--yes]             Stop services (--clean deletes volumes)\n\n";

  out << "  INSPECTION\n";
  out << "  status [--verbose] [--json] [--health]\n";
  out << "                                     Show the state of every catalog service\n";
  out << "  health [--verbose] [SERVICE...]    Probe service health endpoints\n";
  out << "  check [--no-dns] [--no-docker]     Check environment readiness\n\n";

  out << "  OTHER\n";
  out << "  version                            Print version\n";
  out << "  help                               Show this help\n\n";

  out << "  SERVICES\n  ";
  for (const auto service : fleet::kAllServices) {
    out << " " << fleet::to_string(service);
  }
  out << "\n\n";
}

} // namespace

std::string version_string() {
#ifdef SKYHOST_VERSION
  std::string version = SKYHOST_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "skyhost " + version;
}

CliDependencies default_dependencies() {
  CliDependencies deps;
  deps.runner = std::make_shared<process::SubprocessRunner>();
  deps.http = std::make_shared<net::CurlHttpClient>();
  deps.websocket = std::make_shared<net::SocketWebSocketProber>();
  return deps;
}

int run_cli(int argc, char **argv) {
  return run_cli(collect_args(argc - 1, argv + 1), default_dependencies());
}

int run_cli(std::vector<std::string> args, const CliDependencies &deps) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    *deps.err << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help(*deps.out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(*deps.out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    *deps.out << version_string() << "\n";
    return 0;
  }
  if (subcommand == "start") {
    return run_start(std::move(args), deps);
  }
  if (subcommand == "stop") {
    return run_stop(std::move(args), deps);
  }
  if (subcommand == "status") {
    return run_status(std::move(args), deps);
  }
  if (subcommand == "health") {
    return run_health(std::move(args), deps);
  }
  if (subcommand == "check") {
    return run_check(std::move(args), deps);
  }

  *deps.err << "Unknown command: " << subcommand << "\n";
  print_help(*deps.out);
  return 1;
}

} // namespace skyhost::cli
