#include "runclaw/sandbox/container.hpp"

#include "runclaw/common/fs.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <sstream>

namespace runclaw::sandbox {

namespace {

std::string mount_arg(const std::filesystem::path &host, const std::string &container,
                      const bool read_only) {
  std::string mount = host.string() + ":" + container;
  if (read_only) {
    mount += ":ro";
  }
  return mount;
}

} // namespace

std::string short_hash_hex(std::string_view value) {
  const std::size_t hash = std::hash<std::string>{}(std::string(value));
  std::ostringstream out;
  out << std::hex << std::setw(8) << std::setfill('0')
      << static_cast<std::uint32_t>(hash & 0xffffffffU);
  return out.str();
}

std::string slugify(std::string_view input) {
  const std::string normalized = common::to_lower(common::trim(std::string(input)));
  std::string out;
  out.reserve(normalized.size());
  for (char ch : normalized) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' ||
        ch == '-') {
      out.push_back(ch);
    } else {
      out.push_back('-');
    }
  }

  while (!out.empty() && (out.front() == '-' || out.front() == '.')) {
    out.erase(out.begin());
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  if (out.empty()) {
    out = "group";
  }
  if (out.size() > 36) {
    out.resize(36);
  }
  return out;
}

std::string container_name_for(const std::string &group, const std::string &session_key) {
  std::string name = "runclaw-" + slugify(group) + "-" + short_hash_hex(group + "/" + session_key);
  if (name.size() > 63) {
    name.resize(63);
  }
  return name;
}

std::vector<std::string> build_container_args(const config::ContainerConfig &config,
                                              const HandoffBundle &bundle,
                                              const std::string &container_name) {
  std::vector<std::string> args = {config.binary, "run", "--rm", "-i", "--name", container_name};

  if (!common::trim(config.network).empty()) {
    args.push_back("--network");
    args.push_back(config.network);
  }
  args.push_back("--cap-drop");
  args.push_back("ALL");
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");

  if (config.pids_limit.has_value() && *config.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(*config.pids_limit));
  }
  if (config.memory_limit.has_value() && !config.memory_limit->empty()) {
    args.push_back("--memory");
    args.push_back(*config.memory_limit);
  }
  if (config.cpu_limit.has_value() && *config.cpu_limit > 0) {
    args.push_back("--cpus");
    std::ostringstream cpu;
    cpu << std::fixed << std::setprecision(2) << *config.cpu_limit;
    args.push_back(cpu.str());
  }

  args.push_back("-v");
  args.push_back(mount_arg(bundle.group_dir, CONTAINER_GROUP_DIR, false));
  args.push_back("-v");
  args.push_back(mount_arg(bundle.ipc_dir, CONTAINER_IPC_DIR, true));

  // docker copies the value from its own environment when only the name is given
  for (const auto &name : config.passthrough_env) {
    if (common::trim(name).empty() || std::getenv(name.c_str()) == nullptr) {
      continue;
    }
    args.push_back("-e");
    args.push_back(name);
  }

  for (const auto &extra : config.args) {
    if (!common::trim(extra).empty()) {
      args.push_back(extra);
    }
  }

  args.push_back(config.image);
  for (const auto &part : config.command) {
    args.push_back(part);
  }
  return args;
}

common::Result<ProcessSpec> build_process_spec(const config::ContainerConfig &config,
                                               const HandoffBundle &bundle,
                                               const std::string &container_name,
                                               std::string stdin_text,
                                               const std::chrono::milliseconds timeout) {
  ProcessSpec spec;
  spec.stdin_text = std::move(stdin_text);
  spec.timeout = timeout;
  spec.max_output_bytes = static_cast<std::size_t>(config.max_output_bytes);

  if (config.runtime == "docker") {
    if (common::trim(config.image).empty()) {
      return common::Result<ProcessSpec>::failure("container image is not configured");
    }
    spec.argv = build_container_args(config, bundle, container_name);
    return common::Result<ProcessSpec>::success(std::move(spec));
  }

  if (config.runtime == "command") {
    if (config.command.empty()) {
      return common::Result<ProcessSpec>::failure("container.command is empty");
    }
    spec.argv = config.command;
    spec.working_dir = bundle.group_dir;
    spec.env = {
        {"RUNCLAW_GROUP_DIR", bundle.group_dir.string()},
        {"RUNCLAW_IPC_DIR", bundle.ipc_dir.string()},
        {"RUNCLAW_INPUT_FILE", bundle.request_file.string()},
    };
    return common::Result<ProcessSpec>::success(std::move(spec));
  }

  return common::Result<ProcessSpec>::failure("unknown container runtime: " + config.runtime);
}

} // namespace runclaw::sandbox
