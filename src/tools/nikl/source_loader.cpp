//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/nikl/source_loader.cpp
// Purpose: Standardise how the runner checks and reads script files.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedScript owns its buffer.
// Links: src/tools/nikl/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/nikl/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace nikl::tools
{

namespace fs = std::filesystem;

namespace
{

support::Diagnostic loadError(std::string message)
{
    return support::Diagnostic{support::Severity::Error, std::move(message), {}, {}};
}

} // namespace

support::Expected<LoadedScript> loadScript(const std::string &path, support::SourceManager &sm)
{
    std::error_code ec;
    const fs::path file(path);

    if (!fs::exists(file, ec))
        return loadError("file not found: " + path);
    if (!fs::is_regular_file(file, ec))
        return loadError("not a regular file: " + path);
    if (file.extension() != ".nk")
        return loadError("expected a .nk file: " + path);

    std::ifstream in(file, std::ios::binary);
    if (!in)
        return loadError("unable to open " + path);

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
        return loadError("source file too large: " + path + " (limit: 256 MB)");
    if (fileSize == 0)
        return loadError("file is empty: " + path);

    std::ostringstream ss;
    ss << in.rdbuf();

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return loadError("too many source files");

    LoadedScript script{};
    script.buffer = ss.str();
    script.fileId = fileId;
    return script;
}

} // namespace nikl::tools
