#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <cstddef>

namespace debtscan::util {

/**
 * Read-only file content, either owned in a buffer or backed by a private
 * memory mapping. Move-only; the mapping is released on destruction.
 */
class FileContent {
public:
    FileContent() = default;
    ~FileContent();

    FileContent(FileContent&& other) noexcept;
    FileContent& operator=(FileContent&& other) noexcept;
    FileContent(const FileContent&) = delete;
    FileContent& operator=(const FileContent&) = delete;

    static FileContent from_buffer(std::string buffer);
    static FileContent from_mapping(void* address, size_t length);
    static FileContent failure(std::string message);

    std::string_view view() const;
    size_t size() const { return view().size(); }
    bool is_mapped() const { return mapped_ != nullptr; }

    bool is_valid = true;
    std::string error_message;

private:
    void release();

    std::string buffer_;
    void* mapped_ = nullptr;
    size_t mapped_len_ = 0;
};

/**
 * LargeFileReader: content access strategy chosen by file size.
 *
 * Files strictly larger than the threshold are mmap'ed (PROT_READ,
 * MAP_PRIVATE) so peak memory stays bounded for very large sources;
 * everything else is read into a buffer with read(2). Both paths expose
 * the same bytes through FileContent::view().
 */
class LargeFileReader {
public:
    static constexpr size_t DEFAULT_MMAP_THRESHOLD = 256 * 1024;

    explicit LargeFileReader(size_t mmap_threshold = DEFAULT_MMAP_THRESHOLD);

    [[nodiscard]] FileContent read(const std::filesystem::path& path) const;

    size_t mmap_threshold() const { return mmap_threshold_; }

private:
    size_t mmap_threshold_;
};

}  // namespace debtscan::util
