#pragma once

/// @file include/datahub/atomic_file.hpp
/// @brief Write-to-temp-then-rename file replacement.
///
/// The temporary file lives next to the destination so that the final
/// `rename` stays on one filesystem and is atomic. Readers of the destination
/// therefore see either the old or the new content, never a partial write.
///
/// ```cpp
/// AtomicFileWriter out(path);
/// out.write(bytes);
/// out.commit();   // fsync, rename over `path`, fsync the directory
/// ```
///
/// If the writer is destroyed before `commit`, the temporary file is removed
/// and the destination is left exactly as it was.

#include <filesystem>
#include <string_view>

namespace datahub::store {

class AtomicFileWriter {
public:
    /// Create the temporary file beside `destination`.
    /// Throws IoError if it cannot be created.
    explicit AtomicFileWriter(std::filesystem::path destination);

    /// Removes the temporary file unless `commit` succeeded.
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    /// Append `bytes` to the temporary file. Throws IoError.
    void write(std::string_view bytes);

    /// Flush and sync the temporary file, rename it over the destination and
    /// sync the directory entry. Throws IoError; on failure the destination
    /// is untouched and the temporary file is removed.
    void commit();

    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] const std::filesystem::path& temp_path() const noexcept { return temp_path_; }
    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    void discard() noexcept;

    std::filesystem::path destination_;
    std::filesystem::path temp_path_;
    int                   fd_        = -1;
    bool                  committed_ = false;
};

}  // namespace datahub::store
