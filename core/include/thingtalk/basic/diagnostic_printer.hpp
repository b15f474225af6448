// thingtalk/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "thingtalk/basic/diagnostic.hpp"
#include "thingtalk/basic/source_manager.hpp"

namespace thingtalk
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[T004]: unknown parameter 'foo' for @com.twitter.post
 *     --> rules.tt:3:22
 *      |
 *    3 | now => @com.twitter.post(foo="x");
 *      |                          ^^^^^^^ not an input of this function
 *      |
 *      = help: the function accepts: status
 *
 * Programs built in memory carry no source text. Without a SourceManager
 * the printer falls back to the header line plus notes and help.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic; `origin` names the program when there is no source.
  void print(
    const Diagnostic & diag, const SourceManager * sources = nullptr,
    std::string_view origin = "<program>");

  /// Print all diagnostics, ordered by primary location.
  void print_all(
    const DiagnosticBag & diags, const SourceManager * sources = nullptr,
    std::string_view origin = "<program>");

  /// One-line summary, e.g. "2 errors, 1 warning".
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & sources);

  void print_source_line(
    const SourceManager & sources, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace thingtalk
