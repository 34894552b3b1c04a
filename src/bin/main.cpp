#include <xns/attribute_json.hpp>
#include <xns/attribute_map.hpp>
#include <xns/attribute_writer.hpp>
#include <xns/expat_attribute_reader.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;

struct cli_options {
  std::vector<std::string> xml_files;
  std::optional<std::string> namespace_filter;
  bool merge = false;
  bool json = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xns-attrs [options] <file.xml> [file2.xml ...]\n"
     << "\n"
     << "Prints the namespace-qualified attributes of every element.\n"
     << "\n"
     << "Options:\n"
     << "  --merge           Merge all elements into one attribute map "
        "(later elements win)\n"
     << "  --namespace <uri> Only print attributes in this namespace\n"
     << "  --json            Print JSON instead of XML attribute syntax\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xns-attrs " << XNS_VERSION << "\n";
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

    if (arg == "--merge") {
      opts.merge = true;
      continue;
    }

    if (arg == "--json") {
      opts.json = true;
      continue;
    }

    if (arg == "--namespace") {
      if (i + 1 >= argc) {
        std::cerr << "xns-attrs: --namespace requires an argument\n";
        std::exit(exit_usage);
      }
      opts.namespace_filter = argv[++i];
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "xns-attrs: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.xml_files.push_back(arg);
  }

  return opts;
}

static std::optional<std::string>
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { return std::nullopt; }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Narrows attrs to a single namespace when a filter is set.
static xns::string_attribute_map
filter_namespace(const xns::string_attribute_map& attrs,
                 const cli_options& opts) {
  if (!opts.namespace_filter) { return attrs; }

  xns::string_attribute_map selected;
  const std::string& ns = *opts.namespace_filter;
  for (const auto& [name, value] : attrs.get_attributes(ns)) {
    selected.set_attribute(ns, name, value);
  }
  return selected;
}

static void
print(std::ostream& os, const std::string& element,
      const xns::string_attribute_map& attrs, const cli_options& opts) {
  if (opts.json) {
    nlohmann::json j = attrs;
    os << j.dump() << "\n";
    return;
  }
  xns::write_empty_element(os, element, attrs);
  os << "\n";
}

static int
run(const cli_options& opts) {
  xns::string_attribute_map merged;

  for (const auto& file : opts.xml_files) {
    auto xml = read_file(file);
    if (!xml) {
      std::cerr << "xns-attrs: cannot open file: " << file << "\n";
      return exit_io;
    }

    try {
      xns::expat_attribute_reader reader(*xml);
      while (reader.read()) {
        if (opts.merge) {
          merged.merge(reader.attributes());
          continue;
        }
        print(std::cout, reader.name().local_name,
              filter_namespace(reader.attributes(), opts), opts);
      }
    } catch (const std::exception& e) {
      std::cerr << "xns-attrs: error reading " << file << ": " << e.what()
                << "\n";
      return exit_parse;
    }
  }

  if (opts.merge) {
    print(std::cout, "merged", filter_namespace(merged, opts), opts);
  }

  return exit_success;
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

  if (opts.xml_files.empty()) {
    std::cerr << "xns-attrs: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
