#pragma once

#include "toolguard/security/tool_call.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolguard::security {

struct FilesystemWriteResult {
  bool is_write = false;
  std::optional<std::string> target_path;
};

/// Argument keys searched, in order, for the path a write-capable tool targets.
[[nodiscard]] const std::vector<std::string> &write_path_keys();

[[nodiscard]] FilesystemWriteResult classify_filesystem_write(const std::string &tool_name,
                                                              const ToolArgs &args,
                                                              const ToolCallOptions &options = {});

} // namespace toolguard::security
