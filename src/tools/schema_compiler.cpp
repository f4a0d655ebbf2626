#include <boost/program_options.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <schemata/builder/package_builder.hpp>
#include <schemata/contract/non_inflatable_asset.hpp>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/parser.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/identity.hpp>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using encoder_t = schemata::schema::encoding::encoder<
    schemata::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

void init_logging(const bool verbose, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "schemata", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::optional<std::string> read_file(const std::string& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  auto buffer = std::stringstream{};
  buffer << in.rdbuf();
  return buffer.str();
}

bool write_file(const std::string& path, const std::string& contents) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!out) {
    return false;
  }
  out << contents << '\n';
  return static_cast<bool>(out);
}

std::string render(const schemata::schema::bytes_t& bytes,
                   const std::string& format) {
  if (format == "base64") {
    return schemata::schema::to_base64(bytes);
  }
  return schemata::schema::to_hex(
      schemata::schema::bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<schemata::schema::bytes_t> parse(const std::string& text,
                                               const std::string& format) {
  auto compact = std::string{};
  for (const auto ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      compact.push_back(ch);
    }
  }
  if (format == "base64") {
    return schemata::schema::try_from_base64(compact);
  }
  return schemata::schema::try_from_hex(compact);
}

template <typename T>
int report_failure(const schemata::schema::build_result<T>& result) {
  spdlog::error("{}: {}", result.log, result.info);
  return 1;
}

int emit(const schemata::schema::bytes_t& encoded,
         const std::string& output,
         const std::string& format) {
  auto text = render(encoded, format);
  if (output.empty()) {
    std::cout << text << std::endl;
    return 0;
  }
  if (!write_file(output, text)) {
    spdlog::error("cannot write '{}'", output);
    return 1;
  }
  spdlog::info("Wrote {} encoded bytes to '{}'", encoded.size(), output);
  return 0;
}

int assemble_source(const std::string& path,
                    const std::string& output,
                    const std::string& format) {
  auto source = read_file(path);
  if (!source) {
    spdlog::error("cannot read '{}'", path);
    return 1;
  }
  auto statements = schemata::isa::parse_assembly(*source);
  if (!statements) {
    return report_failure(statements);
  }
  auto assembly = schemata::isa::assemble(*statements.value);
  if (!assembly) {
    return report_failure(assembly);
  }
  const auto& library = assembly.value->library;
  auto listing = schemata::isa::disassemble(
      schemata::schema::bytes_view_t{library.code.data(), library.code.size()});
  if (!listing) {
    return report_failure(listing);
  }

  std::cout << "library " << schemata::schema::to_hex(assembly.value->id)
            << " (" << library.isa << ", " << library.code.size()
            << " bytes)\n";
  for (const auto& [label, offset] : assembly.value->labels) {
    std::cout << "label " << label << " @ " << offset << '\n';
  }
  std::cout << schemata::isa::listing(*listing.value);

  if (output.empty()) {
    return 0;
  }
  auto encoder = encoder_t{};
  return emit(encoder.encode(library), output, format);
}

int verify_package(const std::string& path, const std::string& format) {
  auto text = read_file(path);
  if (!text) {
    spdlog::error("cannot read '{}'", path);
    return 1;
  }
  auto bytes = parse(*text, format);
  if (!bytes) {
    spdlog::error("'{}' is not valid {}", path, format);
    return 1;
  }
  auto encoder = encoder_t{};
  auto package = encoder.try_decode<schemata::schema::package_t>(
      schemata::schema::bytes_view_t{bytes->data(), bytes->size()});
  if (!package) {
    spdlog::error("'{}' does not decode as a package", path);
    return 1;
  }
  auto validated = schemata::builder::validate_package(*package);
  if (!validated) {
    return report_failure(validated);
  }
  std::cout << "schema " << validated.value->schema.name << ' '
            << schemata::schema::to_hex(
                   schemata::schema::schema_id(validated.value->schema))
            << '\n';
  for (const auto& library : validated.value->scripts) {
    std::cout << "library "
              << schemata::schema::to_hex(schemata::schema::library_id(library))
              << '\n';
  }
  return 0;
}

int build_nia(const schemata::contract::nia_config_t& config,
              const std::optional<int64_t> timestamp,
              const bool print_listing,
              const std::string& output,
              const std::string& format) {
  auto asset = schemata::contract::non_inflatable_asset{config};
  auto package = asset.package(timestamp);
  if (!package) {
    return report_failure(package);
  }

  const auto& built = *package.value;
  std::cout << "schema " << built.schema.name << ' '
            << schemata::schema::to_hex(schemata::schema::schema_id(built.schema))
            << '\n';
  std::cout << "iface "
            << schemata::schema::to_hex(built.iface_impl.iface_id) << '\n';
  for (const auto& library : built.scripts) {
    std::cout << "library "
              << schemata::schema::to_hex(schemata::schema::library_id(library))
              << '\n';
    if (print_listing) {
      auto listing = schemata::isa::disassemble(
          schemata::schema::bytes_view_t{library.code.data(),
                                         library.code.size()});
      if (!listing) {
        return report_failure(listing);
      }
      std::cout << schemata::isa::listing(*listing.value);
    }
  }

  auto encoder = encoder_t{};
  return emit(encoder.encode(built), output, format);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config = schemata::contract::nia_config_t{};
  auto output = std::string{};
  auto format = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"schemata-compile"};
  // Operands go through the assembler's own number parser; a uint16_t
  // option would let lexical_cast wrap "-1" to 65535.
  auto operand = [](uint16_t& target, const char* name) {
    return po::value<std::string>()
        ->default_value(std::to_string(target))
        ->notifier([&target, name](const std::string& text) {
          auto parsed = schemata::isa::parse_operand(text);
          if (!parsed) {
            throw po::validation_error{
                po::validation_error::invalid_option_value, name, text};
          }
          target = *parsed.value;
        });
  };
  description.add_options()("help,h", "Show the help message")(
      "bound-upper", operand(config.genesis_upper_bound, "bound-upper"),
      "Upper bound operand of the genesis commitment check")(
      "bound-lower", operand(config.genesis_lower_bound, "bound-lower"),
      "Lower bound operand of the genesis commitment check")(
      "family", operand(config.transfer_commitment_family, "family"),
      "Commitment family verified by the transfer check")(
      "timestamp", po::value<int64_t>(),
      "Binding timestamp in seconds since epoch (default: now)")(
      "output,o", po::value<std::string>(&output),
      "Write the encoded artifact here instead of stdout")(
      "format,f", po::value<std::string>(&format)->default_value("hex"),
      "Encoding of written/read artifacts: hex or base64")(
      "disassemble,d", "Print the validation library listing")(
      "source,s", po::value<std::string>(),
      "Assemble this assembly file instead of building the package")(
      "verify", po::value<std::string>(),
      "Decode and validate a previously written package, including the "
      "validator opcodes it records")(
      "log-file", po::value<std::string>(&log_file),
      "Also write logs to this file")("verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  if (format != "hex" && format != "base64") {
    std::cerr << "unsupported format '" << format << "'" << std::endl;
    return 2;
  }

  init_logging(vm.contains("verbose"), log_file);

  auto rc = 0;
  if (vm.contains("source")) {
    rc = assemble_source(vm["source"].as<std::string>(), output, format);
  } else if (vm.contains("verify")) {
    rc = verify_package(vm["verify"].as<std::string>(), format);
  } else {
    auto timestamp = std::optional<int64_t>{};
    if (vm.contains("timestamp")) {
      timestamp = vm["timestamp"].as<int64_t>();
    }
    rc = build_nia(config, timestamp, vm.contains("disassemble"), output,
                   format);
  }

  spdlog::shutdown();
  return rc;
}
