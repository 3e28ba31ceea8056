#pragma once

#include <optional>
#include <string>

#include "sema.hpp"
#include "source.hpp"
#include "target.hpp"

namespace keel {

struct Session;

// Reads a textual CFG module. `target` overrides a missing `target` line and
// must agree with a present one. Returns nullopt if any error was reported.
std::optional<Namespace> read_module(Session& session, FileId file,
                                     std::optional<TargetKind> target);

// Registers `text` under `path` and reads it.
std::optional<Namespace> read_module_text(Session& session, std::string path,
                                          std::string text,
                                          std::optional<TargetKind> target);

}  // namespace keel
