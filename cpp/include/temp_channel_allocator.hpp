#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "interpreter_capabilities.hpp"

namespace psrelay {
namespace core {

enum class ChannelKind {
    Script,      ///< Body spilled to a .ps1 file
    Stdout,
    Stderr,
    ExitStatus   ///< Exit-status marker written by the elevated interpreter
};

const char* to_string(ChannelKind kind) noexcept;

/**
 * @brief Owns the temporary files of one invocation.
 *
 * Every file is created exclusively under a unique name. release_all() is
 * idempotent and also runs from the destructor, so files are removed on every
 * exit path. A file that cannot be removed yet (still open by a child) is kept
 * on the list and retried by the next release_all().
 */
class TempChannelAllocator {
public:
    /// Empty directory means the OS temporary directory.
    explicit TempChannelAllocator(std::filesystem::path directory = {});
    ~TempChannelAllocator();

    TempChannelAllocator(const TempChannelAllocator&) = delete;
    TempChannelAllocator& operator=(const TempChannelAllocator&) = delete;
    TempChannelAllocator(TempChannelAllocator&&) = delete;
    TempChannelAllocator& operator=(TempChannelAllocator&&) = delete;

    /// Create an empty channel file. Empty optional on failure.
    std::optional<std::filesystem::path> allocate(ChannelKind kind);

    /// Create a script channel holding body in the interpreter's native encoding.
    std::optional<std::filesystem::path> allocate_script(std::string_view body, TextEncoding encoding);

    /// Read a channel back in full. Empty optional if it cannot be opened.
    static std::optional<std::string> read_back(const std::filesystem::path& path);

    /// Remove all files. True when none are left on disk.
    bool release_all() noexcept;

    const std::vector<std::filesystem::path>& live() const noexcept { return live_; }

private:
    std::optional<std::filesystem::path> create_exclusive_(ChannelKind kind, std::string_view content);

    std::filesystem::path directory_;
    std::vector<std::filesystem::path> live_;
};

} // namespace core
} // namespace psrelay
