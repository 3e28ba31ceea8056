#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "diag.hpp"
#include "source.hpp"

namespace keel {

std::filesystem::path normalize_path(std::filesystem::path path);

struct Session {
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    FileId add_file(std::filesystem::path path);

    void error(Span span, std::string message);
    void note(Span span, std::string message);

    bool has_errors() const;
    std::size_t error_count() const;
};

}  // namespace keel
