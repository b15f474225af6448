// thingtalk/ast/manifest.hpp - Legacy Thingpedia manifest interchange
//
// Older device packages describe their classes as JSON manifests rather
// than class declarations. These functions convert between the two forms.
// The conversion is lossy in both directions: manifests carry no argument
// inheritance, and classes carry no `params` labels besides the argument
// name.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "thingtalk/ast/class_def.hpp"

namespace thingtalk
{

/**
 * Convert a class to a manifest.
 * @throws ManifestError if a configuration parameter has a type with no
 *         HTML input form
 */
[[nodiscard]] nlohmann::json to_manifest(const ClassDef & klass);

/**
 * Convert a manifest to a class.
 * @throws ManifestError on an unknown HTML input type or a malformed manifest
 */
[[nodiscard]] ClassDefPtr from_manifest(const std::string & kind, const nlohmann::json & manifest);

/**
 * Read a manifest file. The class kind is `kind` when not empty, else the
 * `kind` field of the manifest, else the file stem.
 * @throws ManifestError on unreadable or malformed files
 */
[[nodiscard]] ClassDefPtr load_manifest_file(
  const std::filesystem::path & path, const std::string & kind = "");

/// `text`, `password`, ... to the matching type
[[nodiscard]] TypePtr html_type_to_type(const std::string & html_type);

/// Inverse of html_type_to_type(); entities without a dedicated input map to `text`
[[nodiscard]] std::string type_to_html(const Type & type);

}  // namespace thingtalk
