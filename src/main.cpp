#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <altyn/execution/config.hpp>
#include <altyn/execution/engine.hpp>
#include <altyn/rpc/server.hpp>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <exception>
#include <iostream>
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

  auto db_path = std::string{};
  auto grpc_port = std::string{};
  auto config_path = std::string{};
  auto log_path = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Altyn"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "altyn-db"),
      "RocksDB directory for the ledger")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)->default_value(
          "0.0.0.0:50051"),
      "IP:Port for the ledger gRPC service")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "Rates and identity directory file")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_path)->default_value(
          "altyn.log"),
      "Log file path")("read-only",
                       "Serve queries from an existing ledger; reject writes")(
      "verbose,v", "Enable debug logging");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "altyn", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto config = altyn::execution::ledger_config{};
  if (!config_path.empty()) {
    try {
      config = altyn::execution::load_ledger_config(config_path);
    } catch (const std::exception& ex) {
      spdlog::critical("Invalid configuration: {}", ex.what());
      spdlog::shutdown();
      return 1;
    }
  } else {
    spdlog::warn("No configuration file; identity directory is empty");
  }

  auto engine = altyn::execution::engine{
      db_path, config.directory.resolver(), config.rates,
      vm.contains("read-only") ? altyn::storage::open_mode::read_only
                               : altyn::storage::open_mode::read_write};

  spdlog::info("gRPC service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = altyn::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down ledger service");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
