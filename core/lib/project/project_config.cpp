// minilang/project/project_config.cpp - Project configuration implementation
//
#include "minilang/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace minilang
{

namespace
{

ConfigLoadResult parse_config(const YAML::Node & root, ProjectConfig config)
{
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (const auto pkg = root["package"]) {
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  if (const auto check = root["check"]) {
    if (check["entry_points"]) {
      if (!check["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("check.entry_points must be a list");
      }
      for (const auto & ep : check["entry_points"]) {
        config.check.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    if (check["metrics_file"]) {
      config.check.metrics_file = check["metrics_file"].as<std::string>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

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
    return parse_config(root, std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
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

}  // namespace minilang
