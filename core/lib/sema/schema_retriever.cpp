// thingtalk/sema/schema_retriever.cpp - Source of device class declarations
#include "thingtalk/sema/schema_retriever.hpp"

#include "thingtalk/ast/manifest.hpp"

namespace thingtalk
{

FunctionDefPtr SchemaRetriever::get_schema(
  const std::string & kind, FunctionType type, const std::string & name)
{
  auto klass = get_class(kind);
  if (!klass) {
    return nullptr;
  }
  auto fn = klass->get_function(type, name);
  if (!fn || (type == FunctionType::Stream && !fn->is_monitorable)) {
    return nullptr;
  }
  return fn->clone_function();
}

void MemorySchemaRetriever::add_class(ClassDefPtr klass)
{
  auto kind = klass->kind;
  classes_[kind] = std::move(klass);
}

ClassDefPtr MemorySchemaRetriever::load_manifest(const std::filesystem::path & path)
{
  auto klass = load_manifest_file(path);
  add_class(klass);
  return klass;
}

ClassDefPtr MemorySchemaRetriever::get_class(const std::string & kind)
{
  auto it = classes_.find(kind);
  return it != classes_.end() ? it->second : nullptr;
}

std::vector<std::string> MemorySchemaRetriever::kinds() const
{
  std::vector<std::string> out;
  out.reserve(classes_.size());
  for (const auto & [kind, klass] : classes_) {
    out.push_back(kind);
  }
  return out;
}

}  // namespace thingtalk
