// thingtalk/sema/schema_retriever.hpp - Source of device class declarations
//
// The type checker never owns classes: it asks a SchemaRetriever for the
// class of each device kind it meets. Implementations decide where the
// classes come from (memory, manifest files, a remote registry).
//
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "thingtalk/ast/class_def.hpp"

namespace thingtalk
{

class SchemaRetriever
{
public:
  virtual ~SchemaRetriever() = default;

  /// The class declared for `kind`, or null when unknown
  [[nodiscard]] virtual ClassDefPtr get_class(const std::string & kind) = 0;

  /**
   * The function `name` of the class `kind`, or null when either is
   * unknown. Streams resolve to monitorable queries. The result is a copy
   * that keeps its class alive.
   */
  [[nodiscard]] virtual FunctionDefPtr get_schema(
    const std::string & kind, FunctionType type, const std::string & name);
};

/// Serves classes registered in memory
class MemorySchemaRetriever : public SchemaRetriever
{
public:
  MemorySchemaRetriever() = default;

  /// Register a class, replacing any class of the same kind
  void add_class(ClassDefPtr klass);

  /**
   * Load a manifest file. The class kind is the `kind` field of the
   * manifest, or the file stem when absent.
   * @throws ManifestError on unreadable or malformed files
   */
  ClassDefPtr load_manifest(const std::filesystem::path & path);

  [[nodiscard]] ClassDefPtr get_class(const std::string & kind) override;

  [[nodiscard]] bool has_class(const std::string & kind) const
  {
    return classes_.count(kind) != 0;
  }
  [[nodiscard]] std::vector<std::string> kinds() const;

private:
  std::map<std::string, ClassDefPtr> classes_;
};

}  // namespace thingtalk
