#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "wirehdr/cli/commands.hpp"

using namespace wirehdr;
using namespace wirehdr::cli;

namespace {

// 仕様例のヘッダーを30バイトに符号化した結果
const std::string kScenarioHex =
    "10a7c05e" "1800" "0100"       // magic, 宣言長24, バージョン1.0
    "01" "ffffffffffffffff"        // provider, session
    "01" "01" "00"                 // content_type, accept_type, auth_type
    "64000000" "0000" "0900" "0000";  // body_len, auth_len, opcode, status

} // namespace

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "wirehdr_cli_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    int run_cli(std::vector<std::string> args) {
        args.insert(args.begin(), "wirehdr_tool");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        out.str("");
        err.str("");
        return run(static_cast<int>(argv.size()), argv.data(), utils::RuntimeConfig{}, out, err);
    }

    std::filesystem::path test_dir;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(CliTest, EncodeScenarioPrintsHex) {
    EXPECT_EQ(run_cli({"encode", "--provider=1", "--session=0xFFFFFFFFFFFFFFFF", "--content_type=1",
                       "--accept_type=1", "--body_len=100", "--opcode=9"}),
              kExitOk);
    EXPECT_EQ(kScenarioHex.size(), 60u);
    EXPECT_EQ(out.str(), kScenarioHex + "\n");
}

// 未指定フィールドは0
TEST_F(CliTest, EncodeDefaultsToZeroFields) {
    EXPECT_EQ(run_cli({"encode"}), kExitOk);
    EXPECT_EQ(out.str(), "10a7c05e18000100" + std::string(44, '0') + "\n");
}

TEST_F(CliTest, EncodeRejectsOutOfRangeField) {
    EXPECT_EQ(run_cli({"encode", "--provider=256"}), kExitUsage);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(run_cli({"encode", "--opcode=65536"}), kExitUsage);
    EXPECT_EQ(run_cli({"encode", "--status=abc"}), kExitUsage);
    EXPECT_EQ(run_cli({"encode", "--body_len=4294967295"}), kExitOk);
}

TEST_F(CliTest, DecodeHexPrintsJson) {
    EXPECT_EQ(run_cli({"decode", kScenarioHex}), kExitOk);
    const std::string json = out.str();
    EXPECT_NE(json.find("\"provider\": 1,"), std::string::npos);
    EXPECT_NE(json.find("\"session\": 18446744073709551615,"), std::string::npos);
    EXPECT_NE(json.find("\"body_len\": 100,"), std::string::npos);
    EXPECT_NE(json.find("\"opcode\": 9,"), std::string::npos);
}

TEST_F(CliTest, DecodeBadMagicFails) {
    std::string bad = "00000000" + kScenarioHex.substr(8);
    EXPECT_EQ(run_cli({"decode", bad}), kExitFailure);
    EXPECT_NE(err.str().find("invalid header"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliTest, DecodeTruncatedIsConnectionError) {
    EXPECT_EQ(run_cli({"decode", kScenarioHex.substr(0, 40)}), kExitFailure);
    EXPECT_NE(err.str().find("connection error"), std::string::npos);
}

TEST_F(CliTest, DecodeMalformedHexIsUsageError) {
    EXPECT_EQ(run_cli({"decode", "abc"}), kExitUsage);
    EXPECT_EQ(run_cli({"decode", "zz"}), kExitUsage);
}

TEST_F(CliTest, DecodeFileReadsFrame) {
    auto path = test_dir / "frame.bin";
    auto bytes = from_hex(kScenarioHex);
    ASSERT_TRUE(bytes.has_value());
    {
        std::ofstream f(path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
    }
    EXPECT_EQ(run_cli({"decode-file", path.string()}), kExitOk);
    EXPECT_NE(out.str().find("\"opcode\": 9,"), std::string::npos);

    EXPECT_EQ(run_cli({"decode-file", (test_dir / "missing.bin").string()}), kExitFailure);
}

TEST_F(CliTest, UsageErrors) {
    EXPECT_EQ(run_cli({}), kExitUsage);
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);
    EXPECT_EQ(run_cli({"frobnicate"}), kExitUsage);
    EXPECT_EQ(run_cli({"decode"}), kExitUsage);
    EXPECT_EQ(run_cli({"decode", "aa", "bb"}), kExitUsage);
}

TEST_F(CliTest, HexHelpers) {
    const std::vector<uint8_t> data = {0x00, 0x0f, 0xa7, 0xff};
    EXPECT_EQ(to_hex(data), "000fa7ff");
    auto parsed = from_hex("00:0F A7ff");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, data);
}
