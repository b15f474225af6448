// thingtalk/project/project_config.hpp - Project configuration (thingtalk.yaml)
//
// A project names the manifest files that declare its device classes and
// the options the checker and the diagnostic printer run with.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace thingtalk
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct PackageConfig
{
  std::string name;
  std::string version;
};

/// `schemas` section: where device classes come from
struct SchemaConfig
{
  /// Manifest files, relative to the project root
  std::vector<std::filesystem::path> manifests;

  /// Directories whose *.json files are all loaded as manifests
  std::vector<std::filesystem::path> directories;
};

/// When the diagnostic printer emits terminal colors
enum class ColorMode {
  Auto,
  Always,
  Never,
};

/// `checker` section
struct CheckerConfig
{
  bool lenient_entities = true;
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (thingtalk.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  SchemaConfig schemas;
  CheckerConfig checker;

  /// Directory containing thingtalk.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Every manifest file of the project, absolute, in a stable order
  [[nodiscard]] std::vector<std::filesystem::path> manifest_files() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a thingtalk.yaml file.
 *
 * @param config_path Path to thingtalk.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find thingtalk.yaml by searching upward from start_dir (or from the
 * parent of start_dir when it is a file).
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

[[nodiscard]] std::optional<ColorMode> parse_color_mode(const std::string & text);

inline constexpr const char * k_project_config_file_name = "thingtalk.yaml";

}  // namespace thingtalk
