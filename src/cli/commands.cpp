#include "wirehdr/cli/commands.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

#include <fcntl.h>

#include "wirehdr/io/fd_stream.hpp"
#include "wirehdr/proto/codec.hpp"
#include "wirehdr/utils/log_config.hpp"
#include "wirehdr/utils/posix_wrapper.hpp"

namespace wirehdr::cli {

using proto::WireHeader;

namespace {

void usage(std::ostream& err) {
  err << "Usage:\n"
      << "  wirehdr_tool encode [--provider=N] [--session=N] [--content_type=N] [--accept_type=N]\n"
      << "                      [--auth_type=N] [--body_len=N] [--auth_len=N] [--opcode=N] [--status=N]\n"
      << "  wirehdr_tool decode <hex>\n"
      << "  wirehdr_tool decode-file <path|->\n"
      << "Common options: --log.level=LEVEL --log.file=PATH --log.format=text|json --io.timeout_ms=N\n";
}

// フィールド幅に収まらない値は nullopt
template<typename T>
std::optional<T> field(const utils::ConfigLoader& args, const std::string& key) {
  if (!args.has(key)) return T{0};
  auto v = utils::config_utils::parse_uint(args.get_string(key));
  if (!v || *v > std::numeric_limits<T>::max()) return std::nullopt;
  return static_cast<T>(*v);
}

// 位置引数（--で始まらないもの）を抽出
std::vector<std::string> positionals(int argc, char** argv) {
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--", 0) != 0) out.push_back(a);
  }
  return out;
}

int print_result(const Result<WireHeader>& res, std::ostream& out, std::ostream& err) {
  if (!res) {
    err << "decode error: " << res.error().message() << "\n";
    return kExitFailure;
  }
  out << to_json(res.value());
  return kExitOk;
}

int cmd_encode(int argc, char** argv, std::ostream& out, std::ostream& err) {
  utils::ConfigLoader args;
  args.load_from_command_line(argc, argv);

  auto h = header_from_args(args);
  if (!h) {
    err << "invalid field value\n";
    return kExitUsage;
  }
  auto res = proto::encode_frame(*h);
  if (!res) {
    err << "encode error: " << res.error().message() << "\n";
    return kExitFailure;
  }
  out << to_hex(res.value()) << "\n";
  return kExitOk;
}

int cmd_decode_hex(const std::string& text, std::ostream& out, std::ostream& err) {
  auto bytes = from_hex(text);
  if (!bytes) {
    err << "invalid hex input\n";
    return kExitUsage;
  }
  return print_result(proto::decode_frame(*bytes), out, err);
}

int cmd_decode_file(const std::string& path, const utils::RuntimeConfig& rc, std::ostream& out,
                    std::ostream& err) {
  int fd = 0;
  if (path != "-") {
    fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
      err << "open " << path << ": " << std::strerror(errno) << "\n";
      return kExitFailure;
    }
  }
  io::FdStream stream(fd);
  if (rc.io_timeout.count() > 0) {
    if (auto ec = stream.set_timeout(rc.io_timeout)) {
      auto log = utils::LogManager::instance().get_logger("wirehdr.tool");
      WIREHDR_LOG_WARNING(log, "Timeout not applied to " + path + ": " + ec.message());
    }
  }
  auto res = proto::read_from_stream(stream);
  if (fd != 0) utils::PosixWrapper::closeFd(fd);
  return print_result(res, out, err);
}

} // namespace

std::string to_hex(std::span<const std::uint8_t> bytes) {
  std::ostringstream ss;
  for (auto b : bytes) ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(b);
  return ss.str();
}

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& text) {
  std::string digits;
  for (char c : text) {
    if (c == ' ' || c == ':' || c == '\n') continue;
    digits += c;
  }
  if (digits.size() % 2 != 0) return std::nullopt;
  std::vector<std::uint8_t> out;
  out.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    auto v = utils::config_utils::parse_uint("0x" + digits.substr(i, 2));
    if (!v) return std::nullopt;
    out.push_back(static_cast<std::uint8_t>(*v));
  }
  return out;
}

std::string to_json(const WireHeader& h) {
  std::ostringstream ss;
  ss << "{\n"
     << "  \"provider\": " << static_cast<unsigned>(h.provider) << ",\n"
     << "  \"session\": " << h.session << ",\n"
     << "  \"content_type\": " << static_cast<unsigned>(h.content_type) << ",\n"
     << "  \"accept_type\": " << static_cast<unsigned>(h.accept_type) << ",\n"
     << "  \"auth_type\": " << static_cast<unsigned>(h.auth_type) << ",\n"
     << "  \"body_len\": " << h.body_len << ",\n"
     << "  \"auth_len\": " << h.auth_len << ",\n"
     << "  \"opcode\": " << h.opcode << ",\n"
     << "  \"status\": " << h.status << "\n"
     << "}\n";
  return ss.str();
}

std::optional<WireHeader> header_from_args(const utils::ConfigLoader& args) {
  auto provider = field<uint8_t>(args, "provider");
  auto session = field<uint64_t>(args, "session");
  auto content_type = field<uint8_t>(args, "content_type");
  auto accept_type = field<uint8_t>(args, "accept_type");
  auto auth_type = field<uint8_t>(args, "auth_type");
  auto body_len = field<uint32_t>(args, "body_len");
  auto auth_len = field<uint16_t>(args, "auth_len");
  auto opcode = field<uint16_t>(args, "opcode");
  auto status = field<uint16_t>(args, "status");
  if (!provider || !session || !content_type || !accept_type || !auth_type ||
      !body_len || !auth_len || !opcode || !status) {
    return std::nullopt;
  }
  WireHeader h{};
  h.provider = *provider;
  h.session = *session;
  h.content_type = *content_type;
  h.accept_type = *accept_type;
  h.auth_type = *auth_type;
  h.body_len = *body_len;
  h.auth_len = *auth_len;
  h.opcode = *opcode;
  h.status = *status;
  return h;
}

int run(int argc, char** argv, const utils::RuntimeConfig& rc, std::ostream& out, std::ostream& err) {
  auto args = positionals(argc, argv);
  if (args.empty()) {
    usage(err);
    return kExitUsage;
  }

  const std::string& cmd = args[0];
  if (cmd == "encode" && args.size() == 1) return cmd_encode(argc, argv, out, err);
  if (cmd == "decode" && args.size() == 2) return cmd_decode_hex(args[1], out, err);
  if (cmd == "decode-file" && args.size() == 2) return cmd_decode_file(args[1], rc, out, err);
  usage(err);
  return kExitUsage;
}

} // namespace wirehdr::cli
