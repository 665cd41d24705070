//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps file identifiers to normalized paths for diagnostics.
// Key invariants: File id 0 is invalid; identifiers are stable for the
//                 manager's lifetime.
// Ownership/Lifetime: Owns stored file path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nikl::support
{

/// Maintains the mapping between numeric file identifiers and their
/// corresponding filesystem paths. Registering the same path twice yields the
/// same identifier.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view if unknown.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

  private:
    /// Index corresponds to file identifier - 1. A deque keeps string
    /// references stable as new files are added.
    std::deque<std::string> files_;

    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace nikl::support
