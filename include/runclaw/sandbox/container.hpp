#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/config/schema.hpp"
#include "runclaw/sandbox/handoff.hpp"
#include "runclaw/sandbox/process.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace runclaw::sandbox {

inline constexpr const char *CONTAINER_GROUP_DIR = "/workspace/group";
inline constexpr const char *CONTAINER_IPC_DIR = "/workspace/ipc";

[[nodiscard]] std::string slugify(std::string_view input);
[[nodiscard]] std::string short_hash_hex(std::string_view value);

/// `runclaw-<group slug>-<hash of group and session>`, at most 63 characters.
[[nodiscard]] std::string container_name_for(const std::string &group,
                                             const std::string &session_key);

/// Full argv for `docker run`, starting with the configured binary.
[[nodiscard]] std::vector<std::string> build_container_args(const config::ContainerConfig &config,
                                                            const HandoffBundle &bundle,
                                                            const std::string &container_name);

/// What to launch for one execution under the configured runtime.
[[nodiscard]] common::Result<ProcessSpec>
build_process_spec(const config::ContainerConfig &config, const HandoffBundle &bundle,
                   const std::string &container_name, std::string stdin_text,
                   std::chrono::milliseconds timeout);

} // namespace runclaw::sandbox
