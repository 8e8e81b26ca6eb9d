#include <gtest/gtest.h>
#include <vellum/request/message_file.hpp>
#include <vellum/testing/fixtures.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef VELLUM_CLI_PATH
#define VELLUM_CLI_PATH ""
#endif

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

class cli : public ::testing::Test {
 protected:
  void SetUp() override {
    binary_ = VELLUM_CLI_PATH;
    if (binary_.empty() || !std::filesystem::exists(binary_)) {
      GTEST_SKIP() << "vellum binary not found";
    }
    directory_ = vellum::testing::make_temp_path("vellum_cli");
    std::filesystem::create_directories(directory_);
    pem_file_ = directory_ + "/identity.pem";
    std::ofstream{pem_file_} << vellum::testing::kEd25519Pem;
  }

  void TearDown() override {
    if (!directory_.empty()) {
      vellum::testing::remove_path(directory_);
    }
  }

  std::pair<int, std::string> run(const std::string_view args) const {
    return run_capture(shell_quote(binary_) + " " + std::string{args} +
                       " 2>/dev/null");
  }

  std::string run_ok(const std::string_view args) const {
    auto [exit_code, output] = run(args);
    EXPECT_EQ(exit_code, 0) << "command failed: " << args << '\n' << output;
    return output;
  }

  std::string pem_arg() const {
    return "--pem-file " + shell_quote(pem_file_);
  }

  std::string binary_;
  std::string directory_;
  std::string pem_file_;
};

}  // namespace

TEST_F(cli, public_ids_of_the_key) {
  const auto output = run_ok("public-ids " + pem_arg());
  EXPECT_NE(output.find("Principal id: " +
                        std::string{vellum::testing::kSenderPrincipal}),
            std::string::npos)
      << output;
  EXPECT_NE(output.find("Account id: " +
                        std::string{vellum::testing::kSenderAccount}),
            std::string::npos)
      << output;
  EXPECT_NE(output.find("Scheme: ed25519"), std::string::npos) << output;
}

TEST_F(cli, key_can_come_from_standard_input) {
  const auto [exit_code, output] =
      run_capture("cat " + shell_quote(pem_file_) + " | " +
                  shell_quote(binary_) + " public-ids --pem-file - 2>/dev/null");
  EXPECT_EQ(exit_code, 0);
  EXPECT_NE(output.find(vellum::testing::kSenderPrincipal), std::string::npos)
      << output;
}

TEST_F(cli, account_id_of_a_principal) {
  EXPECT_EQ(trim_ascii_whitespace(run_ok("account-id --principal 2vxsx-fae")),
            vellum::testing::kAnonymousAccount);
  EXPECT_EQ(
      trim_ascii_whitespace(run_ok(
          "account-id " + pem_arg() + " --subaccount " +
          "0000000000000000000000000000000000000000000000000000000000000001")),
      "81f885f56ad30a8581f35c92b7f8666e418b2c66faf042fd2bfa1fcd352df47c");
}

TEST_F(cli, transfer_then_dry_run) {
  const auto message_file = directory_ + "/transfer.json";
  run_ok("transfer " + pem_arg() + " --to " +
         std::string{vellum::testing::kAnonymousAccount} +
         " --amount 2.5 --memo 42 --output " + shell_quote(message_file));

  auto stream = std::ifstream{message_file};
  const auto text = std::string{std::istreambuf_iterator<char>{stream},
                                std::istreambuf_iterator<char>{}};
  auto error = vellum::common::error{};
  auto entries = vellum::request::parse_message_file(text, error);
  ASSERT_TRUE(entries.has_value()) << vellum::common::describe(error);
  ASSERT_EQ(entries->size(), 1u);
  EXPECT_TRUE(vellum::request::verify(entries->front().ingress, error))
      << vellum::common::describe(error);
  EXPECT_TRUE(entries->front().request_status.has_value());

  const auto rendered = run_ok("dry-run --input " + shell_quote(message_file));
  EXPECT_NE(rendered.find("=== Message 1 (update) ==="), std::string::npos)
      << rendered;
  EXPECT_NE(rendered.find("transfer"), std::string::npos) << rendered;
  EXPECT_NE(rendered.find("2.5 tokens (250_000_000 e8s)"), std::string::npos)
      << rendered;
  EXPECT_NE(rendered.find("(valid)"), std::string::npos) << rendered;
  EXPECT_NE(rendered.find("--- Request status ---"), std::string::npos)
      << rendered;
}

TEST_F(cli, queries_have_no_status_request) {
  const auto output = run_ok("account-balance " + pem_arg());
  auto error = vellum::common::error{};
  auto entries = vellum::request::parse_message_file(output, error);
  ASSERT_TRUE(entries.has_value()) << vellum::common::describe(error);
  ASSERT_EQ(entries->size(), 1u);
  EXPECT_EQ(entries->front().call_type, vellum::schema::call_type_t::query);
  EXPECT_FALSE(entries->front().request_status.has_value());
}

TEST_F(cli, neuron_stake_signs_transfer_and_claim) {
  const auto output =
      run_ok("neuron-stake " + pem_arg() + " --name test --amount 1");
  auto error = vellum::common::error{};
  auto entries = vellum::request::parse_message_file(output, error);
  ASSERT_TRUE(entries.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(entries->size(), 2u);
}

TEST_F(cli, failures_exit_non_zero) {
  EXPECT_EQ(run("transfer " + pem_arg() + " --to 1234 --amount 1").first, 1);
  EXPECT_EQ(run("transfer " + pem_arg() + " --amount 1").first, 1);
  EXPECT_EQ(
      run("public-ids --pem-file " + shell_quote(directory_ + "/missing.pem"))
          .first,
      1);
  EXPECT_EQ(run("transfer " + pem_arg() + " --to " +
                std::string{vellum::testing::kAnonymousAccount} +
                " --amount 1 --ingress-expiry-seconds 301")
                .first,
            1);
  EXPECT_EQ(
      run("neuron-manage " + pem_arg() + " --neuron-id 1 2 --disburse").first,
      1);
  EXPECT_EQ(run("frobnicate").first, 2);
  EXPECT_EQ(run("public-ids --no-such-option").first, 2);
}
