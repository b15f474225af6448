// thingtalk/basic/diagnostic.hpp - Diagnostics reported by type checking
//
// Type errors are the one user-facing error category of the core. The
// checker reports them into a DiagnosticBag and keeps going, so a caller
// sees every problem of a program at once.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "thingtalk/basic/source_manager.hpp"

namespace thingtalk
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "";
}

// ============================================================================
// Diagnostic codes
// ============================================================================

/// Codes attached to the diagnostics the core and its tools report.
namespace diag_code
{

// type checking
inline constexpr std::string_view k_unknown_function = "T001";
inline constexpr std::string_view k_unknown_parameter = "T002";
inline constexpr std::string_view k_not_an_input = "T003";
inline constexpr std::string_view k_parameter_type = "T004";
inline constexpr std::string_view k_duplicate_parameter = "T005";
inline constexpr std::string_view k_unknown_filter_field = "T006";
inline constexpr std::string_view k_filter_type = "T007";
inline constexpr std::string_view k_missing_filter = "T008";
inline constexpr std::string_view k_unknown_projection_field = "T009";
inline constexpr std::string_view k_invalid_aggregation = "T010";
inline constexpr std::string_view k_unknown_variable = "T011";
inline constexpr std::string_view k_operand_type = "T012";
inline constexpr std::string_view k_not_monitorable = "T013";
inline constexpr std::string_view k_invalid_principal = "T014";
inline constexpr std::string_view k_invalid_scalar = "T015";

// manifest loading
inline constexpr std::string_view k_invalid_manifest = "M001";
inline constexpr std::string_view k_duplicate_class = "M002";

}  // namespace diag_code

enum class LabelStyle {
  Primary,    // the construct the message is about
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "T004"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder for one diagnostic. The diagnostic is added to the bag
 * when the builder is destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Warning, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Info, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_hint(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Hint, range, std::move(message), std::move(label_message));
  }

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t error_count() const;

  /// True if any diagnostic carries the given code
  [[nodiscard]] bool has_code(std::string_view code) const;

  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace thingtalk
