#include <gtest/gtest.h>
#include <vigil/schema/primitives.hpp>
#include <vigil/testing/common.hpp>
#include <vigil/testing/process.hpp>

#include <filesystem>
#include <string>
#include <string_view>

#ifndef VIGIL_CLI_PATH
#define VIGIL_CLI_PATH ""
#endif

namespace {

using vigil::testing::make_identity;
using vigil::testing::shell_quote;

class cli_queue final {
 public:
  explicit cli_queue(const std::string_view prefix)
      : db_path_{vigil::testing::make_db_path(prefix)},
        log_path_{vigil::testing::make_db_path(std::string{prefix} + "_log")} {}
  ~cli_queue() {
    vigil::testing::remove_path(db_path_);
    vigil::testing::remove_path(log_path_);
  }

  const std::string& db_path() const { return db_path_; }

  std::pair<int, std::string> run(const std::string_view args) const {
    auto command = shell_quote(VIGIL_CLI_PATH) + " " + std::string{args} +
                   " --db-path " + shell_quote(db_path_) + " --log-file " +
                   shell_quote(log_path_) + " 2>/dev/null";
    return vigil::testing::run_capture(command);
  }

  std::string admin_flag() const {
    return "--caller " + vigil::schema::to_hex(make_identity(1));
  }

  void init(const std::string_view extra) const {
    auto [exit_code, output] = run(
        "init --administrator " + vigil::schema::to_hex(make_identity(1)) +
        " --avatar " + vigil::schema::to_hex(make_identity(2)) + " " +
        std::string{extra});
    ASSERT_EQ(exit_code, 0) << output;
  }

  std::string status() const {
    auto [exit_code, output] = run("status");
    EXPECT_EQ(exit_code, 0) << output;
    return output;
  }

 private:
  std::string db_path_;
  std::string log_path_;
};

bool cli_available() {
  auto path = std::string{VIGIL_CLI_PATH};
  return !path.empty() && std::filesystem::exists(path);
}

}  // namespace

TEST(vigil_cli, set_cooldown_requires_an_explicit_value) {
  if (!cli_available()) {
    GTEST_SKIP() << "vigil binary not available: " << VIGIL_CLI_PATH;
  }
  auto queue = cli_queue{"vigil_cli_cooldown"};
  queue.init("--cooldown 30");

  EXPECT_NE(queue.run("set-cooldown " + queue.admin_flag()).first, 0);
  EXPECT_NE(queue.status().find("\ncooldown 30\n"), std::string::npos);

  EXPECT_EQ(queue.run("set-cooldown --cooldown 0 " + queue.admin_flag()).first,
            0);
  EXPECT_NE(queue.status().find("\ncooldown 0\n"), std::string::npos);
}

TEST(vigil_cli, set_expiration_requires_an_explicit_value) {
  if (!cli_available()) {
    GTEST_SKIP() << "vigil binary not available: " << VIGIL_CLI_PATH;
  }
  auto queue = cli_queue{"vigil_cli_expiration"};
  queue.init("--expiration 120");

  EXPECT_NE(queue.run("set-expiration " + queue.admin_flag()).first, 0);
  EXPECT_NE(queue.status().find("\nexpiration 120\n"), std::string::npos);

  EXPECT_EQ(
      queue.run("set-expiration --expiration 0 " + queue.admin_flag()).first,
      0);
  EXPECT_NE(queue.status().find("\nexpiration 0\n"), std::string::npos);
}

TEST(vigil_cli, commands_on_a_missing_queue_leave_no_directory) {
  if (!cli_available()) {
    GTEST_SKIP() << "vigil binary not available: " << VIGIL_CLI_PATH;
  }
  auto queue = cli_queue{"vigil_cli_missing"};
  for (const auto* command : {"status", "skip-expired"}) {
    EXPECT_EQ(queue.run(command).first, 1) << command;
    EXPECT_FALSE(std::filesystem::exists(queue.db_path())) << command;
  }
}
