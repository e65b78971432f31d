#include <boost/program_options.hpp>
#include <clocale>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <titlefs/cancel.hpp>
#include <titlefs/copier.hpp>
#include <titlefs/local_fs.hpp>
#include <titlefs/log.hpp>
#include <titlefs/title_manager.hpp>
#include <titlefs/utils.hpp>
#include <vector>

namespace po = boost::program_options;

#define STRINGIFY_(x) #x
#define STRINGIFY(x) STRINGIFY_(x)

// exit status of an operation stopped by SIGINT
constexpr int EXIT_CANCELLED = 130;

static titlefs::cancel_token g_cancel;

extern "C" void on_sigint(int) { g_cancel.cancel(); }

static void put_exception(std::exception &e) { std::cerr << e.what() << '\n'; }

static void put_os(std::ostream &os, const std::string &msg,
                   std::ostringstream &oss) {
  os << msg << oss.str() << '\n';
}

static void put_msg(const std::string &msg, std::ostringstream &oss) {
  put_os(std::cout, msg, oss);
}

static void put_err(const std::string &msg, std::ostringstream &oss) {
  put_os(std::cerr, msg, oss);
}

static void parse_subcmd(const po::options_description &desc,
                         const po::basic_parsed_options<char> &parsed,
                         po::variables_map &vm) {
  auto opts = po::collect_unrecognized(parsed.options, po::include_positional);
  opts.erase(opts.begin());

  // parse again
  po::store(po::command_line_parser(opts).options(desc).run(), vm);
  po::notify(vm);
}

static void parse_error(const po::options_description &desc,
                        std::ostream &ostream, titlefs::result_base &ret) {
  ostream << desc;
  ret.success = false;
}

static void set_fail(titlefs::result_base &ret, std::string &&msg) {
  ret.success = false;
  ret.msg = std::move(msg);
}

static bool parse_section(const std::string &str, titlefs::section_type &out) {
  if (str == "code") {
    out = titlefs::section_type::code;
  } else if (str == "data") {
    out = titlefs::section_type::data;
  } else if (str == "logo") {
    out = titlefs::section_type::logo;
  } else {
    return false;
  }
  return true;
}

static bool parse_integrity(const std::string &str,
                            titlefs::integrity_level &out) {
  if (str == "none") {
    out = titlefs::integrity_level::none;
  } else if (str == "error") {
    out = titlefs::integrity_level::error_on_invalid;
  } else {
    return false;
  }
  return true;
}

static titlefs::manager_config make_config(const std::string &cfg_dir) {
  if (cfg_dir.empty()) {
    return titlefs::manager_config::defaults();
  }
  return titlefs::manager_config::from_dir(titlefs::utf8str_to_path(cfg_dir));
}

// Render a finished copy. Returns true when it was cancelled.
static bool take_outcome(titlefs::copy_outcome &&outcome,
                         titlefs::result_base &ret) {
  if (outcome.cancelled) {
    ret.msg = "cancelled";
    return true;
  }
  if (!outcome.ret.success) {
    set_fail(ret, titlefs::describe(outcome.ret));
  }
  return false;
}

static bool parse_extract(titlefs::result_base &ret, std::ostringstream &oss,
                          po::basic_parsed_options<char> &parsed,
                          po::variables_map &vm, const std::string &cfg_dir) {
  std::string package;
  std::string section_str;
  std::string output;
  std::string integrity_str;
  int program_index = 0;

  po::options_description desc(
      "extract a section of a package into a directory\n"
      "Usage: titlefs extract -p <package> -s code|data|logo -o <dir> "
      "[-i <program_index>] [--integrity none|error]\n"
      "Options");
  desc.add_options()("package,p", po::value<std::string>(&package),
                     ".nca, .nsp, .pfs0 or .xci file")(
      "section,s", po::value<std::string>(&section_str),
      "code, data or logo")("output,o", po::value<std::string>(&output),
                            "destination directory")(
      "index,i", po::value<int>(&program_index)->default_value(0),
      "program index used to look up updates")(
      "integrity", po::value<std::string>(&integrity_str),
      "none or error, default error")("help,h", "");
  parse_subcmd(desc, parsed, vm);

  if (vm.count("help")) {
    oss << desc;
    return false;
  }
  if (!vm.count("package") || !vm.count("section") || !vm.count("output")) {
    parse_error(desc, oss, ret);
    return false;
  }

  titlefs::section_type section;
  if (!parse_section(section_str, section)) {
    set_fail(ret, "unknown section: " + section_str);
    return false;
  }

  auto cfg = make_config(cfg_dir);
  if (vm.count("integrity") && !parse_integrity(integrity_str, cfg.integrity)) {
    set_fail(ret, "unknown integrity level: " + integrity_str);
    return false;
  }

  titlefs::title_manager manager{std::move(cfg)};
  std::signal(SIGINT, on_sigint);
  auto outcome = manager.extract_section(
      titlefs::utf8str_to_path(package), section,
      titlefs::utf8str_to_path(output), g_cancel, program_index);
  std::signal(SIGINT, SIG_DFL);

  return take_outcome(std::move(outcome), ret);
}

static void parse_save(titlefs::result_base &ret, std::ostringstream &oss,
                       po::basic_parsed_options<char> &parsed,
                       po::variables_map &vm, const std::string &cfg_dir) {
  std::string title_str;
  std::string name;
  std::string type_str;
  std::string user_str;
  titlefs::control_property control;

  po::options_description desc(
      "print the save data directory of a title, creating it if missing\n"
      "Usage: titlefs save -t <title_id> [-n <name>] [--type user|device|bcat] "
      "[-u <user_id>]\n"
      "Options");
  desc.add_options()("tid,t", po::value<std::string>(&title_str),
                     "title id, hex")("name,n", po::value<std::string>(&name),
                                      "title name, for messages")(
      "type", po::value<std::string>(&type_str)->default_value("user"),
      "user, device or bcat")("user,u", po::value<std::string>(&user_str),
                              "user id, 32 hex digits")(
      "user-size",
      po::value<int64_t>(&control.user_account_save_data_size)
          ->default_value(0),
      "user account save size declared by the title")(
      "user-journal",
      po::value<int64_t>(&control.user_account_save_data_journal_size)
          ->default_value(0),
      "user account save journal size")(
      "device-size",
      po::value<int64_t>(&control.device_save_data_size)->default_value(0),
      "device save size")(
      "device-journal",
      po::value<int64_t>(&control.device_save_data_journal_size)
          ->default_value(0),
      "device save journal size")(
      "bcat-size",
      po::value<int64_t>(&control.bcat_delivery_cache_storage_size)
          ->default_value(0),
      "bcat delivery cache size")("help,h", "");
  parse_subcmd(desc, parsed, vm);

  if (vm.count("help")) {
    oss << desc;
    return;
  }
  if (!vm.count("tid")) {
    parse_error(desc, oss, ret);
    return;
  }

  uint64_t title_id;
  if (!titlefs::parse_hex64(title_str, title_id)) {
    set_fail(ret, "bad title id: " + title_str);
    return;
  }

  auto cfg = make_config(cfg_dir);
  if (vm.count("user") && !titlefs::parse_user_id(user_str, cfg.default_user)) {
    set_fail(ret, "bad user id: " + user_str);
    return;
  }

  titlefs::save_data_filter filter;
  if (type_str == "user") {
    filter = titlefs::save_data_filter::make_user(title_id, cfg.default_user);
  } else if (type_str == "device") {
    filter = titlefs::save_data_filter::make_device(title_id);
  } else if (type_str == "bcat") {
    filter = titlefs::save_data_filter::make_bcat(title_id);
  } else {
    set_fail(ret, "unknown save type: " + type_str);
    return;
  }

  titlefs::title_manager manager{std::move(cfg)};
  auto dir = manager.locate_save_directory(
      title_id, name.empty() ? titlefs::to_hex16(title_id) : name, control,
      filter);
  if (dir.success) {
    ret.msg = titlefs::path_to_utf8str(dir.data);
  } else {
    set_fail(ret, titlefs::describe(dir));
  }
}

static bool parse_copy(titlefs::result_base &ret, std::ostringstream &oss,
                       po::basic_parsed_options<char> &parsed,
                       po::variables_map &vm) {
  std::string src;
  std::string dest;

  po::options_description desc(
      "copy a directory tree\n"
      "Usage: titlefs copy --src <dir> --dest <dir>\n"
      "Options");
  desc.add_options()("src", po::value<std::string>(&src), "source directory")(
      "dest", po::value<std::string>(&dest), "destination directory")("help,h",
                                                                      "");
  parse_subcmd(desc, parsed, vm);

  if (vm.count("help")) {
    oss << desc;
    return false;
  }
  if (!vm.count("src") || !vm.count("dest")) {
    parse_error(desc, oss, ret);
    return false;
  }

  auto src_path = titlefs::utf8str_to_path(src);
  auto dest_path = titlefs::utf8str_to_path(dest);
  if (!std::filesystem::is_directory(src_path)) {
    set_fail(ret, "not a directory: " + src);
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(dest_path, ec);
  if (ec) {
    set_fail(ret, "cannot create " + dest + ": " + ec.message());
    return false;
  }

  titlefs::local_fs src_fs{src_path};
  titlefs::local_fs dest_fs{dest_path};
  std::signal(SIGINT, on_sigint);
  auto outcome = titlefs::copy_directory(src_fs, "/", dest_fs, "/", g_cancel);
  std::signal(SIGINT, SIG_DFL);

  return take_outcome(std::move(outcome), ret);
}

int parse(int argc, const char *argv[]) {
  titlefs::result_base ret{.success = true};
  std::ostringstream oss;
  bool cancelled = false;
  std::string cfg_dir;

  po::options_description global_desc(
      "titlefs extracts sections of game packages and locates save data.\n"
      "Usage: titlefs [--cfg <dir>] [-q] <command> [<args>]\n"
      "Commands: extract | save | copy\n"
      "Global Options");
  global_desc.add_options()("help,h", "")("version,v", "")(
      "quiet,q", "only report errors")(
      "cfg", po::value<std::string>(&cfg_dir),
      "config directory, default $HOME/.config/titlefs_cfg");

  po::options_description hidden("command");
  hidden.add_options()("command", po::value<std::string>(), "")(
      "subargs", po::value<std::vector<std::string>>(), "");

  po::options_description global_cmd_desc;
  global_cmd_desc.add(global_desc).add(hidden);

  po::positional_options_description subcmd;
  subcmd.add("command", 1).add("subargs", -1);

  auto parsed = po::command_line_parser(argc, argv)
                    .options(global_cmd_desc)
                    .positional(subcmd)
                    .allow_unregistered()
                    .run();
  po::variables_map vm;
  po::store(parsed, vm);
  po::notify(vm);

  if (vm.count("quiet")) {
    titlefs::set_log_level(titlefs::log_level::error);
  }

  if (vm.count("command")) {
    auto cmd = vm["command"].as<std::string>();

    if ("extract" == cmd) {
      cancelled = parse_extract(ret, oss, parsed, vm, cfg_dir);
    } else if ("save" == cmd) {
      parse_save(ret, oss, parsed, vm, cfg_dir);
    } else if ("copy" == cmd) {
      cancelled = parse_copy(ret, oss, parsed, vm);
    } else {
      parse_error(global_desc, oss, ret);
    }
  } else if (vm.count("help")) {
    oss << global_desc;
  } else if (vm.count("version")) {
    ret.msg = STRINGIFY(TITLEFS_VERSION);
  } else {
    parse_error(global_desc, oss, ret);
  }

  if (cancelled) {
    put_err(ret.msg, oss);
    return EXIT_CANCELLED;
  }
  if (ret.success) {
    put_msg(ret.msg, oss);
    return 0;
  }
  put_err(ret.msg, oss);
  return 1;
}

int main(int argc, char **argv) {
  setlocale(LC_CTYPE, "en_US.UTF-8");

  try {
    // args are all utf-8 encoded
    return parse(argc, const_cast<const char **>(argv));
  } catch (std::exception &e) {
    put_exception(e);
    return 1;
  }
}
