#include <boost/program_options.hpp>
#include <vigil/common/critical.hpp>
#include <vigil/queue/commitment.hpp>
#include <vigil/schema/action.hpp>
#include <vigil/schema/call_type.hpp>
#include <vigil/schema/primitives.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace {

namespace po = boost::program_options;

vigil::schema::action_t make_action(const po::variables_map& vm) {
  if (!vm.contains("to")) {
    vigil::common::critical("missing required --to");
  }
  auto to = vigil::schema::try_make_hash32(vm["to"].as<std::string>());
  if (!to) {
    vigil::common::critical("--to must be 32 bytes of hex");
  }
  auto value = vigil::schema::try_parse_amount(vm["value"].as<std::string>());
  if (!value) {
    vigil::common::critical("--value must be a decimal 256-bit integer");
  }
  auto payload =
      vigil::schema::try_from_hex(vm["payload-hex"].as<std::string>());
  if (!payload) {
    vigil::common::critical("--payload-hex must be hex");
  }
  auto call_type = vigil::schema::try_from_string<vigil::schema::call_type_t>(
      vm["call-type"].as<std::string>());
  if (!call_type) {
    vigil::common::critical("--call-type must be call|delegate_call");
  }
  return vigil::schema::action_t{.to = to.value(),
                                 .value = value.value(),
                                 .payload = std::move(payload.value()),
                                 .call_type = call_type.value()};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  commitment_builder hash --to <hex> [options]\n"
            << "  commitment_builder secret-hash --to <hex> --salt <n> "
               "[options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"commitment_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "hash|secret-hash")(
      "config", po::value<std::string>(), "INI file with default options")(
      "to", po::value<std::string>(), "destination identity, 32 bytes hex")(
      "value", po::value<std::string>()->default_value("0"),
      "decimal value forwarded with the call")(
      "payload-hex", po::value<std::string>()->default_value(""),
      "call payload hex")("call-type",
                          po::value<std::string>()->default_value("call"),
                          "call|delegate_call")(
      "salt", po::value<uint64_t>(), "salt assigned at secret enqueue");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      vigil::common::critical("cannot open --config file");
    }
    po::store(po::parse_config_file(file, options), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "hash") {
    auto action = make_action(vm);
    std::cout << vigil::schema::to_hex(vigil::queue::commitment_hash(action))
              << '\n';
    return 0;
  }

  if (command == "secret-hash") {
    if (!vm.contains("salt")) {
      vigil::common::critical("secret-hash requires --salt");
    }
    auto action = make_action(vm);
    std::cout << vigil::schema::to_hex(vigil::queue::secret_commitment_hash(
                     action, vm["salt"].as<uint64_t>()))
              << '\n';
    return 0;
  }

  vigil::common::critical("command must be hash|secret-hash");
}
