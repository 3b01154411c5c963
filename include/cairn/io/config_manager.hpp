#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include "yaml_parser.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

namespace cairn::io {

class ConfigurationManager {
private:
  std::unique_ptr<YamlParser> parser_;
  std::optional<NetworkConfig> current_config_;
  std::filesystem::path config_file_path_;

  [[nodiscard]] auto
  resolve_config_path(std::string_view config_file) const -> std::expected<std::filesystem::path, core::FileError>;

public:
  explicit ConfigurationManager() = default;

  [[nodiscard]] auto load(std::string_view config_file) -> std::expected<NetworkConfig, core::ConfigurationError>;

  [[nodiscard]] auto config_file_path() const noexcept -> const std::filesystem::path& { return config_file_path_; }
};

} // namespace cairn::io
