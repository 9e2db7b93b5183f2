#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vigil/common/critical.hpp>
#include <vigil/execution/engine.hpp>
#include <vigil/schema/delay_config.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace {

namespace po = boost::program_options;

vigil::schema::identity_t get_identity(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    vigil::common::critical("missing required --{}", name);
  }
  auto identity = vigil::schema::try_make_hash32(vm[name].as<std::string>());
  if (!identity) {
    vigil::common::critical("--{} must be 32 bytes of hex", name);
  }
  return identity.value();
}

vigil::schema::identity_t get_identity_or(const po::variables_map& vm,
                                          const std::string& name,
                                          const vigil::schema::identity_t& fallback) {
  return vm.contains(name) ? get_identity(vm, name) : fallback;
}

uint64_t get_number(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    vigil::common::critical("missing required --{}", name);
  }
  return vm[name].as<uint64_t>();
}

vigil::schema::delay_config_t make_config(const po::variables_map& vm) {
  auto config = vigil::schema::delay_config_t{};
  config.administrator = get_identity_or(vm, "administrator",
                                         vigil::schema::make_null_identity());
  config.deployer = get_identity_or(vm, "caller", config.administrator);
  config.avatar =
      get_identity_or(vm, "avatar", vigil::schema::make_null_identity());
  config.target = get_identity_or(vm, "target", config.avatar);
  config.cooldown = vm.contains("cooldown") ? get_number(vm, "cooldown") : 0;
  config.expiration =
      vm.contains("expiration") ? get_number(vm, "expiration") : 0;
  return config;
}

int print_result(const vigil::schema::operation_result_t& result) {
  if (!result.ok()) {
    auto code = static_cast<vigil::schema::queue_error_code>(result.code);
    std::cerr << "error " << result.code << " (" << vigil::schema::to_string(code)
              << ") in " << result.codespace << ": " << result.log;
    if (!result.info.empty()) {
      std::cerr << " [" << result.info << "]";
    }
    std::cerr << '\n';
    return 1;
  }
  for (const auto& event : result.events) {
    std::cout << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
  return 0;
}

void print_status(const vigil::execution::engine& engine) {
  std::cout << "cursor " << engine.cursor() << '\n'
            << "tail " << engine.tail() << '\n'
            << "approved " << engine.approved_count() << '\n'
            << "salt " << engine.salt_counter() << '\n'
            << "cooldown " << engine.cooldown() << '\n'
            << "expiration " << engine.expiration() << '\n'
            << "administrator " << vigil::schema::to_hex(engine.administrator())
            << '\n'
            << "avatar " << vigil::schema::to_hex(engine.avatar()) << '\n'
            << "target " << vigil::schema::to_hex(engine.target()) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  vigil <command> [options]\n\n"
            << "Commands:\n"
            << "  init status entry proposers register deregister enqueue\n"
            << "  enqueue-secret skip-expired veto approve set-cooldown\n"
            << "  set-expiration transfer-admin\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};

  auto description = po::options_description{"Vigil"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "command", po::value<std::string>(&command), "Command to run")(
      "config,c", po::value<std::string>(), "INI file with default options")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("vigil.db"),
      "RocksDB directory holding the queue")(
      "log-file", po::value<std::string>(&log_file)->default_value("vigil.log"),
      "Log file path")("caller", po::value<std::string>(),
                       "Identity issuing the command, 32 bytes hex")(
      "administrator", po::value<std::string>(), "Administrator identity")(
      "avatar", po::value<std::string>(), "Avatar identity")(
      "target", po::value<std::string>(), "Target identity")(
      "cooldown", po::value<uint64_t>(), "Cooldown seconds, 0 when omitted")(
      "expiration", po::value<uint64_t>(),
      "Expiration seconds, 0 or at least 60; 0 when omitted")(
      "proposer", po::value<std::string>(), "Proposer identity")(
      "previous", po::value<std::string>(),
      "Proposer linked before --proposer")(
      "commitment", po::value<std::string>(), "Commitment hash hex")(
      "note", po::value<std::string>()->default_value(""),
      "Reference published with a secret enqueue")(
      "slot", po::value<uint64_t>(), "Queue slot")(
      "cursor", po::value<uint64_t>(), "New cursor for veto")(
      "count", po::value<uint64_t>(), "Entries to approve")(
      "start", po::value<std::string>(), "Resume proposer listing after")(
      "page-size", po::value<uint64_t>()->default_value(10),
      "Proposers per page");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto file = std::ifstream{vm["config"].as<std::string>()};
    if (!file) {
      std::cerr << "cannot open config file " << vm["config"].as<std::string>()
                << '\n';
      return 1;
    }
    po::store(po::parse_config_file(file, description), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(description);
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "vigil", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto path_error = std::error_code{};
  if (command != "init" &&
      !std::filesystem::is_directory(db_path, path_error)) {
    std::cerr << "no queue at " << db_path << "; run init first\n";
    spdlog::shutdown();
    return 1;
  }
  auto storage =
      vigil::storage::make_storage<vigil::storage::rocksdb_storage_tag>(db_path);
  if (command != "init" && !storage.load_queue_state().has_value()) {
    std::cerr << "no queue at " << db_path << "; run init first\n";
    spdlog::shutdown();
    return 1;
  }

  auto encoder = vigil::execution::engine::encoder_t{};
  auto executor = [](const vigil::schema::identity_t& to,
                     const vigil::schema::amount_t&,
                     const vigil::schema::bytes_view_t&,
                     vigil::schema::call_type_t) {
    spdlog::warn("No executor attached; refusing call to {}",
                 vigil::schema::to_hex(to));
    return false;
  };
  auto time_source = [] {
    return static_cast<vigil::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };

  auto exit_code = 0;
  try {
    auto engine = vigil::execution::engine{encoder, storage, make_config(vm),
                                           executor, time_source};
    auto caller = [&vm] { return get_identity(vm, "caller"); };

    if (command == "init") {
      if (engine.restored()) {
        std::cout << "queue already initialized at " << db_path << '\n';
      } else {
        std::cout << engine.setup_event()->type;
        for (const auto& attribute : engine.setup_event()->attributes) {
          std::cout << ' ' << attribute.key << '=' << attribute.value;
        }
        std::cout << '\n';
      }
    } else if (command == "status") {
      print_status(engine);
    } else if (command == "entry") {
      auto slot = get_number(vm, "slot");
      std::cout << "commitment "
                << vigil::schema::to_hex(engine.commitment_at(slot)) << '\n'
                << "created_at " << engine.created_at_of(slot) << '\n';
    } else if (command == "proposers") {
      auto page = engine.list_proposers(
          get_identity_or(vm, "start", vigil::schema::make_sentinel_identity()),
          vm["page-size"].as<uint64_t>());
      for (const auto& proposer : page.proposers) {
        std::cout << vigil::schema::to_hex(proposer) << '\n';
      }
      std::cout << "next " << vigil::schema::to_hex(page.next) << '\n';
    } else if (command == "register") {
      exit_code = print_result(
          engine.register_proposer(caller(), get_identity(vm, "proposer")));
    } else if (command == "deregister") {
      exit_code = print_result(engine.deregister_proposer(
          caller(), get_identity(vm, "previous"), get_identity(vm, "proposer")));
    } else if (command == "enqueue") {
      exit_code = print_result(
          engine.enqueue(caller(), get_identity(vm, "commitment")));
    } else if (command == "enqueue-secret") {
      exit_code = print_result(engine.enqueue_secret(
          caller(), get_identity(vm, "commitment"),
          vm["note"].as<std::string>()));
    } else if (command == "skip-expired") {
      exit_code = print_result(engine.skip_expired());
    } else if (command == "veto") {
      if (vm.contains("count")) {
        exit_code = print_result(engine.veto_up_to_and_approve(
            caller(), get_number(vm, "cursor"), get_number(vm, "count")));
      } else {
        exit_code =
            print_result(engine.veto_up_to(caller(), get_number(vm, "cursor")));
      }
    } else if (command == "approve") {
      exit_code =
          print_result(engine.approve_next(caller(), get_number(vm, "count")));
    } else if (command == "set-cooldown") {
      exit_code = print_result(
          engine.set_cooldown(caller(), get_number(vm, "cooldown")));
    } else if (command == "set-expiration") {
      exit_code = print_result(
          engine.set_expiration(caller(), get_number(vm, "expiration")));
    } else if (command == "transfer-admin") {
      exit_code = print_result(engine.transfer_administrator(
          caller(), get_identity(vm, "administrator")));
    } else {
      std::cerr << "unknown command " << command << '\n';
      exit_code = 1;
    }
  } catch (const vigil::execution::setup_error& ex) {
    std::cerr << "setup failed (" << vigil::schema::to_string(ex.code())
              << "): " << ex.what() << '\n';
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
