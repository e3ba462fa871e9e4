#include <bdt/date_only_codec.hpp>
#include <bdt/errors.hpp>
#include <bdt/offset_date_time_codec.hpp>
#include <bdt/time_only_codec.hpp>
#include <bdt/xml_document_reader.hpp>
#include <bdt/xml_document_writer.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codec = 4;

enum class command { none, encode, decode };
enum class value_kind { date_only, time_only, offset_date_time };

struct cli_options {
  command cmd = command::none;
  std::optional<value_kind> kind;
  std::optional<std::string> representation;
  std::optional<std::string> unit;
  std::optional<std::string> operand;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: bdt encode <type> [options] <value>\n"
     << "       bdt decode <type> [options] [file]\n"
     << "\n"
     << "Types:\n"
     << "  date-only          yyyy-MM-dd\n"
     << "  time-only          HH:mm:ss[.fffffff]\n"
     << "  offset-date-time   yyyy-MM-ddTHH:mm:ss[.fffffff](Z|+hh:mm|-hh:mm)\n"
     << "\n"
     << "Options:\n"
     << "  -r <wire type>     Representation (document, string, int32, "
        "int64,\n"
     << "                     double, date_time, array)\n"
     << "  -u <unit>          time-only unit (ticks, nanoseconds, "
        "microseconds,\n"
     << "                     milliseconds, seconds, minutes, hours, days)\n"
     << "  -h, --help         Show this help message\n"
     << "  --version          Show version information\n"
     << "\n"
     << "encode prints the XML text form of the value; decode reads one from\n"
     << "the file (standard input when omitted) and prints the value.\n";
}

static void
print_version(std::ostream& os) {
  os << "bdt " << BDT_VERSION << "\n";
}

static value_kind
parse_kind(const std::string& name) {
  if (name == "date-only") return value_kind::date_only;
  if (name == "time-only") return value_kind::time_only;
  if (name == "offset-date-time") return value_kind::offset_date_time;
  std::cerr << "bdt: unknown value type: " << name << "\n";
  std::exit(exit_usage);
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-r" || arg == "-u") {
      if (i + 1 >= argc) {
        std::cerr << "bdt: " << arg << " requires an argument\n";
        std::exit(exit_usage);
      }
      (arg == "-r" ? opts.representation : opts.unit) = argv[++i];
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "bdt: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (opts.cmd == command::none) {
      if (arg == "encode") {
        opts.cmd = command::encode;
      } else if (arg == "decode") {
        opts.cmd = command::decode;
      } else {
        std::cerr << "bdt: unknown command: " << arg << "\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (!opts.kind) {
      opts.kind = parse_kind(arg);
      continue;
    }

    if (opts.operand) {
      std::cerr << "bdt: unexpected argument: " << arg << "\n";
      std::exit(exit_usage);
    }
    opts.operand = arg;
  }

  return opts;
}

static std::string
read_input(const std::optional<std::string>& path) {
  std::ostringstream ss;
  if (!path || *path == "-") {
    ss << std::cin.rdbuf();
    return ss.str();
  }
  std::ifstream in(*path, std::ios::binary);
  if (!in) {
    std::cerr << "bdt: cannot open file: " << *path << "\n";
    std::exit(exit_io);
  }
  ss << in.rdbuf();
  return ss.str();
}

static bdt::wire_type
default_representation(value_kind kind) {
  switch (kind) {
    case value_kind::date_only:
      return bdt::date_only_codec::instance()->representation();
    case value_kind::time_only:
      return bdt::time_only_codec::instance()->representation();
    case value_kind::offset_date_time:
      break;
  }
  return bdt::offset_date_time_codec::instance()->representation();
}

// Runs `body` with a codec for `kind` configured from the options.
template <typename Body>
static int
with_codec(const cli_options& opts, Body&& body) {
  bdt::wire_type representation = default_representation(*opts.kind);
  bdt::time_unit unit = bdt::time_unit::ticks;
  try {
    if (opts.representation) {
      representation = bdt::parse_wire_type(*opts.representation);
    }
    if (opts.unit) { unit = bdt::parse_time_unit(*opts.unit); }
  } catch (const std::invalid_argument& e) {
    std::cerr << "bdt: " << e.what() << "\n";
    return exit_usage;
  }

  if (opts.unit && *opts.kind != value_kind::time_only) {
    std::cerr << "bdt: -u only applies to time-only\n";
    return exit_usage;
  }

  try {
    switch (*opts.kind) {
      case value_kind::date_only:
        return body(bdt::date_only_codec(representation));
      case value_kind::time_only:
        return body(bdt::time_only_codec(representation, unit));
      case value_kind::offset_date_time:
        break;
    }
    return body(bdt::offset_date_time_codec(representation));
  } catch (const bdt::configuration_error& e) {
    std::cerr << "bdt: " << e.what() << "\n";
    return exit_codec;
  }
}

template <typename Value>
static std::optional<Value>
parse_value(const std::string& text) {
  try {
    return Value(std::string_view(text));
  } catch (const std::invalid_argument& e) {
    std::cerr << "bdt: invalid value: " << e.what() << "\n";
    return std::nullopt;
  }
}

static int
run_encode(const cli_options& opts) {
  if (!opts.operand) {
    std::cerr << "bdt encode: no value specified\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return with_codec(opts, [&](const auto& codec) {
    using value_type =
        typename std::remove_cvref_t<decltype(codec)>::value_type;
    auto value = parse_value<value_type>(*opts.operand);
    if (!value) return exit_parse;

    try {
      bdt::xml_document_writer writer(std::cout);
      codec.serialize(writer, *value);
      std::cout << "\n";
    } catch (const bdt::encode_error& e) {
      std::cerr << "bdt encode: " << e.what() << "\n";
      return exit_codec;
    }
    return exit_success;
  });
}

static int
run_decode(const cli_options& opts) {
  std::string xml = read_input(opts.operand);

  return with_codec(opts, [&](const auto& codec) {
    std::optional<bdt::xml_document_reader> reader;
    try {
      reader.emplace(xml);
    } catch (const std::runtime_error& e) {
      std::cerr << "bdt decode: " << e.what() << "\n";
      return exit_parse;
    }

    try {
      std::cout << codec.deserialize(*reader) << "\n";
    } catch (const bdt::decode_error& e) {
      std::cerr << "bdt decode: " << e.what() << "\n";
      return exit_codec;
    }
    return exit_success;
  });
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.cmd == command::none || !opts.kind) {
    std::cerr << "bdt: a command and a value type are required\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  if (opts.cmd == command::encode) return run_encode(opts);
  return run_decode(opts);
}
