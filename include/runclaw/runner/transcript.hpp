#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/common/time.hpp"
#include "runclaw/config/config.hpp"
#include "runclaw/protocol/execution.hpp"

#include <filesystem>
#include <string>

namespace runclaw::runner {

[[nodiscard]] std::string transcript_document(const protocol::ExecutionRequest &request,
                                              const protocol::ExecutionResult &result,
                                              common::TimePoint finished_at);

/// Writes `<groups>/logs/<group>/run_<session>_<YYYYmmdd_HHMMSS>.json`.
[[nodiscard]] common::Result<std::filesystem::path>
write_run_transcript(const config::RuntimePaths &paths, const protocol::ExecutionRequest &request,
                     const protocol::ExecutionResult &result, common::TimePoint finished_at);

} // namespace runclaw::runner
