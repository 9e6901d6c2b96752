#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstdlib>
#include <unistd.h>
#endif

#include "../include/temp_channel_allocator.hpp"
#include "../include/dev_debug.hpp"
#include "../include/encoding_normalizer.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace psrelay {
namespace core {

namespace {

const char* suffix_for(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::Script:     return ".ps1";
        case ChannelKind::Stdout:     return ".out";
        case ChannelKind::Stderr:     return ".err";
        case ChannelKind::ExitStatus: return ".rc";
    }
    return ".tmp";
}

#ifdef _WIN32
bool write_all(HANDLE h, std::string_view data) {
    size_t total = 0;
    while (total < data.size()) {
        DWORD chunk = 0;
        BOOL ok = ::WriteFile(h, data.data() + total,
                              (DWORD)std::min<size_t>(std::numeric_limits<DWORD>::max(), data.size() - total),
                              &chunk, NULL);
        if (!ok) return false;
        total += chunk;
    }
    return true;
}

std::wstring random_stem() {
    static std::atomic<unsigned long long> counter{0};
    std::random_device rd;
    const unsigned long long r = (static_cast<unsigned long long>(rd()) << 32) ^ rd() ^ ++counter;
    wchar_t buf[48];
    swprintf(buf, 48, L"psrelay-%lu-%016llx", ::GetCurrentProcessId(), r);
    return buf;
}
#else
bool write_all(int fd, std::string_view data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n > 0) { p += n; left -= (size_t)n; continue; }
        if (n == -1 && errno == EINTR) continue;
        return false;
    }
    return true;
}
#endif

} // namespace

const char* to_string(ChannelKind kind) noexcept {
    switch (kind) {
        case ChannelKind::Script:     return "script";
        case ChannelKind::Stdout:     return "stdout";
        case ChannelKind::Stderr:     return "stderr";
        case ChannelKind::ExitStatus: return "exit-status";
    }
    return "?";
}

TempChannelAllocator::TempChannelAllocator(fs::path directory)
    : directory_(std::move(directory)) {
    if (directory_.empty()) {
        std::error_code ec;
        directory_ = fs::temp_directory_path(ec);
        if (ec) {
            PSRELAY_DBG("CHANNEL", "temp_directory_path failed: %s", ec.message().c_str());
        }
    }
    // Channel paths are read by a child with another working directory.
    if (!directory_.empty() && directory_.is_relative()) {
        std::error_code ec;
        fs::path absolute = fs::absolute(directory_, ec);
        if (ec) {
            PSRELAY_DBG("CHANNEL", "absolute('%s') failed: %s", directory_.string().c_str(), ec.message().c_str());
            directory_.clear();
        } else {
            directory_ = std::move(absolute);
        }
    }
}

TempChannelAllocator::~TempChannelAllocator() {
    (void)release_all();
}

std::optional<fs::path> TempChannelAllocator::allocate(ChannelKind kind) {
    return create_exclusive_(kind, {});
}

std::optional<fs::path> TempChannelAllocator::allocate_script(std::string_view body, TextEncoding encoding) {
    const std::string bytes = encode_native(body, encoding);
    return create_exclusive_(ChannelKind::Script, bytes);
}

std::optional<fs::path> TempChannelAllocator::create_exclusive_(ChannelKind kind, std::string_view content) {
    if (directory_.empty()) return std::nullopt;

#ifdef _WIN32
    const char* narrow = suffix_for(kind);
    const std::wstring suffix(narrow, narrow + std::char_traits<char>::length(narrow));
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = directory_ / (random_stem() + suffix);
        HANDLE h = ::CreateFileW(candidate.c_str(), GENERIC_WRITE, 0, nullptr,
                                 CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            if (::GetLastError() == ERROR_FILE_EXISTS) continue;
            PSRELAY_DBG("CHANNEL", "CreateFileW failed err=%lu", ::GetLastError());
            return std::nullopt;
        }
        live_.push_back(candidate);
        const bool ok = write_all(h, content);
        ::CloseHandle(h);
        if (!ok) {
            PSRELAY_DBG("CHANNEL", "write to %s channel failed", to_string(kind));
            return std::nullopt;
        }
        PSRELAY_DBG("CHANNEL", "allocated %s channel bytes=%zu", to_string(kind), content.size());
        return candidate;
    }
    return std::nullopt;
#else
    const std::string suffix = suffix_for(kind);
    std::string tmpl = (directory_ / ("psrelay-XXXXXX" + suffix)).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd == -1) {
        PSRELAY_DBG("CHANNEL", "mkstemps failed: %s",
                    std::system_category().message(errno).c_str());
        return std::nullopt;
    }
    fs::path created(buf.data());
    live_.push_back(created);

    const bool ok = write_all(fd, content);
    ::close(fd);
    if (!ok) {
        PSRELAY_DBG("CHANNEL", "write to %s channel failed", to_string(kind));
        return std::nullopt;
    }
    PSRELAY_DBG("CHANNEL", "allocated %s channel %s bytes=%zu",
                to_string(kind), created.c_str(), content.size());
    return created;
#endif
}

std::optional<std::string> TempChannelAllocator::read_back(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return data;
}

bool TempChannelAllocator::release_all() noexcept {
    std::vector<fs::path> remaining;
    for (auto& p : live_) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) {
            PSRELAY_DBG("CHANNEL", "could not remove channel file: %s", ec.message().c_str());
            remaining.push_back(std::move(p));
        }
    }
    live_.swap(remaining);
    return live_.empty();
}

} // namespace core
} // namespace psrelay
