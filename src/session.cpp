#include "session.hpp"

#include <utility>

namespace keel {

std::filesystem::path normalize_path(std::filesystem::path path) {
  std::error_code ec{};
  std::filesystem::path abs = std::filesystem::absolute(path, ec);
  if (ec) abs = std::move(path);
  return abs.lexically_normal();
}

FileId Session::add_file(std::filesystem::path path) {
  std::filesystem::path normalized = normalize_path(std::move(path));
  return sources.add_file(normalized.string());
}

void Session::error(Span span, std::string message) {
  diags.push_back(Diagnostic{.severity = Severity::Error, .span = span, .message = std::move(message)});
}

void Session::note(Span span, std::string message) {
  diags.push_back(Diagnostic{.severity = Severity::Note, .span = span, .message = std::move(message)});
}

bool Session::has_errors() const {
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) return true;
  }
  return false;
}

std::size_t Session::error_count() const {
  std::size_t n = 0;
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) n++;
  }
  return n;
}

}  // namespace keel
