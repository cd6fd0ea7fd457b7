/// @file src/store/atomic_file.cpp
/// @brief AtomicFileWriter: temp file, fsync, rename, directory fsync.

#include "datahub/atomic_file.hpp"
#include "datahub/errors.hpp"
#include "datahub/log.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace datahub::store {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

/// ".stock.arrow.tmp-<pid>" beside the destination.
std::filesystem::path temp_path_for(const std::filesystem::path& destination) {
    const std::string name = fmt::format(".{}.tmp-{}",
                                         destination.filename().string(),
                                         static_cast<long>(::getpid()));
    return destination.parent_path() / name;
}

/// Sync the directory entry so the rename survives a power loss.
bool sync_directory(const std::filesystem::path& dir) noexcept {
    const std::string path = dir.empty() ? std::string(".") : dir.string();
    const int fd = ::open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

}  // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

AtomicFileWriter::AtomicFileWriter(std::filesystem::path destination)
    : destination_(std::move(destination))
    , temp_path_(temp_path_for(destination_))
{
    fd_ = ::open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw IoError(fmt::format("cannot create temporary file {}: {}",
                                  temp_path_.string(), errno_text()));
    }
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_) {
        discard();
    }
}

// ─── write ────────────────────────────────────────────────────────────────────

void AtomicFileWriter::write(std::string_view bytes) {
    if (fd_ < 0) {
        throw IoError(fmt::format("write to closed temporary file {}", temp_path_.string()));
    }

    const char* data = bytes.data();
    std::size_t remaining = bytes.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd_, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError(fmt::format("writing {} failed: {}",
                                      temp_path_.string(), errno_text()));
        }
        data      += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

// ─── commit ───────────────────────────────────────────────────────────────────

void AtomicFileWriter::commit() {
    if (committed_) {
        return;
    }
    if (fd_ < 0) {
        throw IoError(fmt::format("commit of closed temporary file {}", temp_path_.string()));
    }

    if (::fsync(fd_) != 0) {
        const std::string reason = errno_text();
        discard();
        throw IoError(fmt::format("fsync of {} failed: {}", temp_path_.string(), reason));
    }

    const int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        const std::string reason = errno_text();
        discard();
        throw IoError(fmt::format("closing {} failed: {}", temp_path_.string(), reason));
    }

    std::error_code ec;
    std::filesystem::rename(temp_path_, destination_, ec);
    if (ec) {
        discard();
        throw IoError(fmt::format("cannot replace {}: {}",
                                  destination_.string(), ec.message()));
    }
    committed_ = true;

    if (!sync_directory(destination_.parent_path())) {
        log::warn("could not sync directory of {}: {}", destination_.string(), errno_text());
    }
}

// ─── discard ──────────────────────────────────────────────────────────────────

void AtomicFileWriter::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
}

}  // namespace datahub::store
