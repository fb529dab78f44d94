#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <guardrail/common/critical.hpp>
#include <guardrail/crypto/verify.hpp>
#include <guardrail/execution/registry.hpp>
#include <guardrail/rpc/server.hpp>
#include <guardrail/schema/encoding/scale/encoder.hpp>
#include <guardrail/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto attestor_key_hex = std::string{};
  auto network_prefix = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Guardrail"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:50051"),
      "IP:Port for the registry gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "guardrail.db"),
      "RocksDB directory holding compliance records")(
      "attestor-public-key,k",
      boost::program_options::value<std::string>(&attestor_key_hex)
          ->required(),
      "Trusted attestor Ed25519 public key (64 hex characters)")(
      "network-prefix",
      boost::program_options::value<std::string>(&network_prefix)
          ->default_value("3"),
      "Leading account character stripped before signature checks; empty "
      "to disable")("log-file",
                    boost::program_options::value<std::string>(&log_file)
                        ->default_value("guardrail.log"),
                    "Log file path")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace|debug|info|warn|error|critical")("verbose,v",
                                              "Shorthand for --log-level debug");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& error) {
    std::cerr << error.what() << '\n' << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "guardrail", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose")
                        ? spdlog::level::debug
                        : spdlog::level::from_str(log_level));

  if (network_prefix.size() > 1) {
    guardrail::common::critical("--network-prefix must be a single character");
  }
  auto prefix = network_prefix.empty()
                    ? std::optional<char>{}
                    : std::optional<char>{network_prefix.front()};

  auto attestor_key =
      guardrail::schema::try_make_ed25519_public_key(attestor_key_hex);
  if (!attestor_key.has_value()) {
    guardrail::common::critical(
        "--attestor-public-key must be 32 bytes of hex");
  }
  if (!guardrail::crypto::available()) {
    guardrail::common::critical("OpenSSL does not provide Ed25519");
  }

  auto encoder = guardrail::schema::encoding::scale_encoder_t{};
  auto storage = guardrail::storage::make_storage<
      guardrail::storage::rocksdb_storage_tag>(db_path);
  auto registry =
      guardrail::execution::registry{encoder, storage, *attestor_key, prefix};

  spdlog::info("Attestor public key {}", attestor_key_hex);
  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = guardrail::rpc::listener{registry};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    guardrail::common::critical("failed to start gRPC server");
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
