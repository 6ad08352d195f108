#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"

#include "skyhost/fleet/catalog.hpp"
#include "skyhost/fleet/compose.hpp"
#include "skyhost/fleet/secrets.hpp"
#include "skyhost/fleet/topology.hpp"
#include "skyhost/observability/global.hpp"
#include "skyhost/observability/log_observer.hpp"

#include <algorithm>
#include <memory>
#include <sstream>

namespace {

namespace fl = skyhost::fleet;
namespace st = skyhost::testing;

constexpr const char *kSecretsToml = "pds_jwt_secret = \"jwt-value\"\n"
                                     "pds_admin_password = \"admin-value\"\n"
                                     "pds_plc_rotation_key = \"rotation-value\"\n";

fl::ComposeOptions options_in(const st::TempWorkspace &workspace) {
  fl::ComposeOptions options;
  options.compose_file = workspace.path() / "docker-compose.yml";
  options.secrets_file = workspace.path() / "config" / "secrets.toml";
  return options;
}

bool contains(const std::vector<std::string> &values, const std::string &needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

skyhost::process::ProcessResult exited(const int code, std::string out = "",
                                       std::string err = "") {
  skyhost::process::ProcessResult result;
  result.exit_code = code;
  result.stdout_text = std::move(out);
  result.stderr_text = std::move(err);
  return result;
}

} // namespace

void register_fleet_tests(std::vector<skyhost::tests::TestCase> &tests) {
  using skyhost::tests::require;
  using skyhost::common::ErrorKind;

  tests.push_back({"catalog_names_round_trip", [] {
                     require(fl::kAllServices.size() == 8, "eight catalog services");
                     for (const auto service : fl::kAllServices) {
                       const auto parsed = fl::parse_service(fl::to_string(service));
                       require(parsed.has_value() && *parsed == service,
                               "round trip " + std::string(fl::to_string(service)));
                     }
                     require(fl::to_string(fl::LogicalService::SocialApp) == "social-app",
                             "hyphenated wire name");
                     require(!fl::parse_service("mastodon").has_value(), "unknown name");
                     require(!fl::parse_service("PDS").has_value(), "names are case-sensitive");
                   }});

  tests.push_back({"topology_parses_object_per_line", [] {
                     const auto topology = fl::parse_topology_listing(
                         R"({"Service":"pds","State":"running","Image":"ghcr.io/bluesky-social/pds:0.4","Publishers":[{"URL":"0.0.0.0","TargetPort":3000,"PublishedPort":2583,"Protocol":"tcp"},{"URL":"","TargetPort":9000,"PublishedPort":0,"Protocol":"tcp"}]})"
                         "\n"
                         R"({"Service":"plc","State":"exited","Publishers":[]})"
                         "\n");
                     require(topology.dropped_records == 0, "no drops");
                     require(topology.services.size() == 2, "two services");
                     const auto &pds = topology.services.at("pds");
                     require(pds.running && pds.state == "running", "pds running");
                     require(pds.ports.size() == 1 && pds.ports[0] == "2583:3000",
                             "only published ports are listed");
                     require(pds.image == "ghcr.io/bluesky-social/pds:0.4", "image");
                     const auto &plc = topology.services.at("plc");
                     require(!plc.running && plc.state == "exited", "plc exited");
                     require(plc.ports.empty(), "no ports");
                   }});

  tests.push_back({"topology_parses_array_line_and_name_fallbacks", [] {
                     const auto topology = fl::parse_topology_listing(
                         R"([{"Name":"bgs","State":"running","Ports":"0.0.0.0:2470->2470/tcp, :::2470->2470/tcp"},{"name":"ozone","state":"restarting","ports":["3000:3000"]}])");
                     require(topology.services.size() == 2, "two services from array");
                     const auto &bgs = topology.services.at("bgs");
                     require(bgs.ports.size() == 2, "Ports string split on comma-space");
                     require(bgs.ports[1] == ":::2470->2470/tcp", "second port");
                     const auto &ozone = topology.services.at("ozone");
                     require(!ozone.running, "restarting is not running");
                     require(ozone.ports.size() == 1 && ozone.ports[0] == "3000:3000",
                             "ports array");
                   }});

  tests.push_back({"topology_prefers_service_over_container_name", [] {
                     const auto topology = fl::parse_topology_listing(
                         R"({"Name":"bsky-pds-1","Service":"pds","State":"running"})");
                     require(topology.services.contains("pds"), "Service key wins");
                     require(!topology.services.contains("bsky-pds-1"), "Name ignored");
                   }});

  tests.push_back({"topology_drops_and_counts_malformed_records", [] {
                     const auto topology = fl::parse_topology_listing(
                         "warning: something happened\n"
                         R"({"Service":"pds","State":"running"})"
                         "\n"
                         R"({"Service":"plc"})"
                         "\n"
                         R"({"State":"running"})"
                         "\n"
                         "{\"Service\":\"bgs\"\n"
                         "[{]\n"
                         "[[[]]]\n"
                         R"({"Service":"pds","State":"running","ports":[})"
                         "\n"
                         R"({"Service":"pds" "State":"running"})"
                         "\n"
                         R"([{"Service":"plc","State":"running"},{"Service":"bgs",}])"
                         "\n"
                         "[]\n"
                         "\n");
                     require(topology.services.size() == 1, "only pds survives");
                     require(topology.dropped_records == 9, "nine dropped");
                   }});

  tests.push_back({"image_tag_extraction", [] {
                     require(fl::image_tag("ghcr.io/bluesky-social/pds:0.4.74") == "0.4.74",
                             "registry image");
                     require(fl::image_tag("localhost:5000/pds") == std::nullopt,
                             "registry port is not a tag");
                     require(fl::image_tag("caddy:2@sha256:abc") == "2", "digest ignored");
                     require(!fl::image_tag("caddy").has_value(), "untagged");
                   }});

  tests.push_back({"secrets_parse_maps_env_names", [] {
                     const auto secrets = fl::parse_secrets(kSecretsToml);
                     require(secrets.ok(), secrets.error());
                     const auto env = secrets.value().as_env_vars();
                     require(env.at("PDS_JWT_SECRET") == "jwt-value", "jwt");
                     require(env.at("PDS_ADMIN_PASSWORD") == "admin-value", "admin");
                     require(env.at("PDS_PLC_ROTATION_KEY_K256") == "rotation-value", "rotation");
                   }});

  tests.push_back({"secrets_missing_file_is_empty", [] {
                     st::TempWorkspace workspace;
                     const auto env = fl::load_secret_env(workspace.path() / "nope.toml");
                     require(env.ok(), env.error());
                     require(env.value().empty(), "no variables");
                   }});

  tests.push_back({"secrets_incomplete_file_is_config_error", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("secrets.toml", "pds_jwt_secret = \"x\"\n");
                     const auto env = fl::load_secret_env(workspace.path() / "secrets.toml");
                     require(!env.ok(), "incomplete secrets should fail");
                     require(env.kind() == ErrorKind::Config, "config kind");
                   }});

  tests.push_back({"compose_start_builds_argv_and_environment", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     workspace.create_file("config/secrets.toml", kSecretsToml);
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     fl::ComposeController compose(options_in(workspace),
                                                   {{"DOMAIN", "example.test"},
                                                    {"PDS_JWT_SECRET", "from-config"}},
                                                   runner);

                     const auto status = compose.start(std::vector<std::string>{"pds", "plc"});
                     require(status.ok(), status.error());
                     const auto calls = runner->calls();
                     require(calls.size() == 1, "one invocation");
                     const auto &argv = calls[0].argv;
                     const std::vector<std::string> expected = {
                         "docker-compose", "-f", (workspace.path() / "docker-compose.yml").string(),
                         "up",             "-d", "pds", "plc"};
                     require(argv == expected, "argv mismatch");
                     const auto &env = calls[0].options.env;
                     require(env.at("DOMAIN") == "example.test", "config env");
                     require(env.at("PDS_JWT_SECRET") == "jwt-value", "secrets override config");
                     require(env.at("PDS_PLC_ROTATION_KEY_K256") == "rotation-value",
                             "rotation key");
                     require(calls[0].options.timeout == std::chrono::milliseconds(600000),
                             "default tool timeout");
                   }});

  tests.push_back({"compose_start_without_secrets_file", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     fl::ComposeController compose(options_in(workspace), {{"DOMAIN", "d"}},
                                                   runner);
                     const auto status = compose.start();
                     require(status.ok(), status.error());
                     const auto calls = runner->calls();
                     require(calls.size() == 1, "one invocation");
                     require(calls[0].argv.back() == "-d", "no service subset");
                     require(!calls[0].options.env.contains("PDS_JWT_SECRET"), "no secrets");
                   }});

  tests.push_back({"compose_missing_file_is_orchestration_error", [] {
                     st::TempWorkspace workspace;
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto start = compose.start();
                     require(!start.ok(), "start should fail");
                     require(start.kind() == ErrorKind::Orchestration, "start kind");
                     require(start.error().find("docker-compose.yml") != std::string::npos,
                             "message names the file");
                     const auto stop = compose.stop(false);
                     require(!stop.ok() && stop.kind() == ErrorKind::Orchestration, "stop");
                     require(runner->calls().empty(), "tool never invoked");
                   }});

  tests.push_back({"compose_failure_surfaces_stderr_verbatim", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker-compose", exited(1, "", "no such service: nope\n"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto status = compose.start(std::vector<std::string>{"nope"});
                     require(!status.ok(), "should fail");
                     require(status.kind() == ErrorKind::Orchestration, "kind");
                     require(status.error().find("no such service: nope") != std::string::npos,
                             status.error());
                   }});

  tests.push_back({"compose_failure_is_not_logged_as_error", [] {
                     namespace ob = skyhost::observability;
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker-compose", exited(1, "", "no such service: nope\n"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);

                     std::ostringstream log;
                     ob::set_global_observer(std::make_unique<ob::LogObserver>(ob::LogLevel::Debug, log));
                     const auto status = compose.start(std::vector<std::string>{"nope"});
                     ob::set_global_observer(nullptr);

                     require(!status.ok(), "should fail");
                     require(log.str().find("[ERROR]") == std::string::npos, log.str());
                     require(log.str().find("no such service") == std::string::npos, log.str());
                   }});

  tests.push_back({"compose_tool_not_installed", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker-compose",
                                exited(127, "", "docker-compose: No such file or directory"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto status = compose.start();
                     require(!status.ok(), "should fail");
                     require(status.error().find("not installed") != std::string::npos,
                             status.error());
                   }});

  tests.push_back({"compose_timeout_is_orchestration_error", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     auto timed_out = exited(-1);
                     timed_out.timed_out = true;
                     runner->on("docker-compose", timed_out);
                     auto options = options_in(workspace);
                     options.tool_timeout = std::chrono::seconds(5);
                     fl::ComposeController compose(options, {}, runner);
                     const auto status = compose.stop(false);
                     require(!status.ok() && status.kind() == ErrorKind::Orchestration, "kind");
                     require(status.error().find("timed out") != std::string::npos,
                             status.error());
                     require(runner->calls()[0].options.timeout == std::chrono::seconds(5),
                             "configured timeout passed to runner");
                   }});

  tests.push_back({"compose_stop_purge_adds_volume_flag", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     require(compose.stop(false).ok(), "stop");
                     require(compose.stop(true).ok(), "purge");
                     const auto calls = runner->calls();
                     require(calls.size() == 2, "two invocations");
                     require(calls[0].argv.back() == "down", "plain down");
                     require(calls[1].argv.back() == "-v" &&
                                 calls[1].argv[calls[1].argv.size() - 2] == "down",
                             "down -v");
                   }});

  tests.push_back({"compose_command_with_two_tokens", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     auto options = options_in(workspace);
                     options.compose_command = "docker compose";
                     fl::ComposeController compose(options, {}, runner);
                     require(compose.stop(false).ok(), "stop");
                     const auto argv = runner->calls()[0].argv;
                     require(argv[0] == "docker" && argv[1] == "compose" && argv[2] == "-f",
                             "split into program and subcommand");
                   }});

  tests.push_back({"compose_options_from_fleet_config", [] {
                     skyhost::config::FleetConfig fleet;
                     fleet.tool_timeout_secs = 0;
                     fleet.compose_command = "docker compose";
                     const auto options = fl::compose_options_from(fleet);
                     require(!options.tool_timeout.has_value(), "0 disables the timeout");
                     require(options.compose_command == "docker compose", "command copied");
                     fleet.tool_timeout_secs = 42;
                     require(fl::compose_options_from(fleet).tool_timeout ==
                                 std::chrono::seconds(42),
                             "seconds converted");
                   }});

  tests.push_back({"dependency_check_succeeds_when_tools_exit_zero", [] {
                     st::TempWorkspace workspace;
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker --version", exited(0, "Docker version 27.0.3\n"));
                     runner->on("docker-compose --version", exited(0, "v2.29.1\n"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto status = compose.check_dependencies();
                     require(status.ok(), status.error());
                     require(runner->find_call("docker --version").has_value(), "docker probed");
                     require(runner->find_call("docker-compose --version").has_value(),
                             "compose probed");
                   }});

  tests.push_back({"dependency_check_fails_for_absent_binary", [] {
                     st::TempWorkspace workspace;
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker-compose --version",
                                exited(127, "", "docker-compose: No such file or directory"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto status = compose.check_dependencies();
                     require(!status.ok(), "missing compose should fail");
                     require(status.kind() == ErrorKind::Orchestration, "kind");
                     require(status.error().find("Docker Compose is not installed") !=
                                 std::string::npos,
                             status.error());

                     auto broken = std::make_shared<st::FakeCommandRunner>();
                     broken->on("docker --version", exited(1, "", "daemon unavailable"));
                     fl::ComposeController docker_missing(options_in(workspace), {}, broken);
                     const auto docker_status = docker_missing.check_dependencies();
                     require(!docker_status.ok(), "docker failure");
                     require(docker_status.error().find("Docker is not installed") !=
                                 std::string::npos,
                             docker_status.error());
                   }});

  tests.push_back({"dependency_check_with_real_missing_binary", [] {
                     st::TempWorkspace workspace;
                     auto options = options_in(workspace);
                     options.docker_command = "skyhost-missing-docker-binary";
                     fl::ComposeController compose(
                         options, {}, std::make_shared<skyhost::process::SubprocessRunner>());
                     const auto status = compose.check_dependencies();
                     require(!status.ok(), "absent binary should fail");
                     require(status.error().find("skyhost-missing-docker-binary") !=
                                 std::string::npos,
                             status.error());
                   }});

  tests.push_back({"query_topology_runs_ps_and_parses", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker-compose -f",
                                exited(0, "{\"Service\":\"pds\",\"State\":\"running\"}\n"
                                          "garbage\n"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto topology = compose.query_topology();
                     require(topology.ok(), topology.error());
                     require(topology.value().services.contains("pds"), "pds parsed");
                     require(topology.value().dropped_records == 1, "garbage counted");
                     const auto argv = runner->calls()[0].argv;
                     require(contains(argv, "ps") && contains(argv, "--format") &&
                                 argv.back() == "json",
                             "ps --format json");
                   }});

  tests.push_back({"query_topology_propagates_tool_failure", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("docker-compose.yml", "services: {}\n");
                     auto runner = std::make_shared<st::FakeCommandRunner>();
                     runner->on("docker-compose -f", exited(1, "", "Cannot connect to the Docker daemon"));
                     fl::ComposeController compose(options_in(workspace), {}, runner);
                     const auto topology = compose.query_topology();
                     require(!topology.ok(), "should fail");
                     require(topology.kind() == ErrorKind::Orchestration, "kind");
                     require(topology.error().find("Cannot connect to the Docker daemon") !=
                                 std::string::npos,
                             topology.error());
                   }});
}
