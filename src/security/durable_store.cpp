#include "toolguard/security/durable_store.hpp"

#include "toolguard/common/fs.hpp"

namespace toolguard::security {

LegacySettingsFile::LegacySettingsFile(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<std::optional<std::string>> LegacySettingsFile::read() {
  auto content = common::read_file(path_);
  if (!content.ok()) {
    return content;
  }
  if (content.value().has_value() && common::trim(*content.value()).empty()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  return content;
}

common::Status LegacySettingsFile::remove() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    return common::Status::error("failed to remove legacy settings " + path_.string() + ": " +
                                 ec.message());
  }
  return common::Status::success();
}

} // namespace toolguard::security
