// thingtalk/project/project_config.cpp - Project configuration (thingtalk.yaml)
//
#include "thingtalk/project/project_config.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace thingtalk
{

namespace
{

/// Read a list of paths; a single scalar is accepted as a one-element list
bool parse_paths(
  const YAML::Node & node, std::vector<std::filesystem::path> & out, std::string & error)
{
  if (node.IsScalar()) {
    out.emplace_back(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) {
    error = "must be a list of paths";
    return false;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = "must be a list of paths";
      return false;
    }
    out.emplace_back(item.as<std::string>());
  }
  return true;
}

}  // namespace

std::optional<ColorMode> parse_color_mode(const std::string & text)
{
  if (text == "auto") {
    return ColorMode::Auto;
  }
  if (text == "always") {
    return ColorMode::Always;
  }
  if (text == "never") {
    return ColorMode::Never;
  }
  return std::nullopt;
}

std::vector<std::filesystem::path> ProjectConfig::manifest_files() const
{
  namespace fs = std::filesystem;

  std::vector<fs::path> out;
  for (const auto & manifest : schemas.manifests) {
    out.push_back(manifest.is_absolute() ? manifest : project_root / manifest);
  }
  for (const auto & dir : schemas.directories) {
    const fs::path root = dir.is_absolute() ? dir : project_root / dir;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      continue;
    }
    std::vector<fs::path> found;
    for (const auto & entry : fs::directory_iterator(root, ec)) {
      if (entry.is_regular_file() && entry.path().extension() == ".json") {
        found.push_back(entry.path());
      }
    }
    // directory order is unspecified
    std::sort(found.begin(), found.end());
    out.insert(out.end(), found.begin(), found.end());
  }
  return out;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    if (root["schemas"]) {
      const auto & schemas = root["schemas"];
      if (!schemas.IsMap()) {
        return ConfigLoadResult::fail("schemas must be a map");
      }
      std::string error;
      if (schemas["manifests"] && !parse_paths(schemas["manifests"], config.schemas.manifests, error)) {
        return ConfigLoadResult::fail("schemas.manifests " + error);
      }
      if (
        schemas["directories"] &&
        !parse_paths(schemas["directories"], config.schemas.directories, error)) {
        return ConfigLoadResult::fail("schemas.directories " + error);
      }
    }

    if (root["checker"]) {
      const auto & checker = root["checker"];
      if (checker["lenient_entities"]) {
        config.checker.lenient_entities = checker["lenient_entities"].as<bool>();
      }
      if (checker["color"]) {
        const auto text = checker["color"].as<std::string>();
        auto mode = parse_color_mode(text);
        if (!mode) {
          return ConfigLoadResult::fail(
            "invalid checker.color: '" + text + "' (must be 'auto', 'always' or 'never')");
        }
        config.checker.color = *mode;
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace thingtalk
