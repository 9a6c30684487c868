#include "util/LargeFileReader.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace debtscan::util {

FileContent::~FileContent() {
    release();
}

FileContent::FileContent(FileContent&& other) noexcept
    : is_valid(other.is_valid),
      error_message(std::move(other.error_message)),
      buffer_(std::move(other.buffer_)),
      mapped_(std::exchange(other.mapped_, nullptr)),
      mapped_len_(std::exchange(other.mapped_len_, 0)) {}

FileContent& FileContent::operator=(FileContent&& other) noexcept {
    if (this != &other) {
        release();
        is_valid = other.is_valid;
        error_message = std::move(other.error_message);
        buffer_ = std::move(other.buffer_);
        mapped_ = std::exchange(other.mapped_, nullptr);
        mapped_len_ = std::exchange(other.mapped_len_, 0);
    }
    return *this;
}

void FileContent::release() {
    if (mapped_) {
        munmap(mapped_, mapped_len_);
        mapped_ = nullptr;
        mapped_len_ = 0;
    }
}

FileContent FileContent::from_buffer(std::string buffer) {
    FileContent content;
    content.buffer_ = std::move(buffer);
    return content;
}

FileContent FileContent::from_mapping(void* address, size_t length) {
    FileContent content;
    content.mapped_ = address;
    content.mapped_len_ = length;
    return content;
}

FileContent FileContent::failure(std::string message) {
    FileContent content;
    content.is_valid = false;
    content.error_message = std::move(message);
    return content;
}

std::string_view FileContent::view() const {
    if (mapped_) {
        return {static_cast<const char*>(mapped_), mapped_len_};
    }
    return buffer_;
}

LargeFileReader::LargeFileReader(size_t mmap_threshold)
    : mmap_threshold_(mmap_threshold) {}

FileContent LargeFileReader::read(const std::filesystem::path& path) const {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return FileContent::failure("open failed: " + std::string(std::strerror(errno)));
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        std::string err = std::strerror(errno);
        close(fd);
        return FileContent::failure("fstat failed: " + err);
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd);
        return FileContent::failure("not a regular file");
    }

    const size_t size = static_cast<size_t>(st.st_size);

    if (size > mmap_threshold_) {
        void* addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (addr != MAP_FAILED) {
            madvise(addr, size, MADV_SEQUENTIAL);
            close(fd);
            Logger::debug("LargeFileReader: Mapped " + path.string() +
                          " (" + std::to_string(size) + " bytes)");
            return FileContent::from_mapping(addr, size);
        }
        // Some filesystems refuse mmap; the buffered path still works
        Logger::warn("LargeFileReader: mmap failed for " + path.string() +
                     ", falling back to buffered read");
    }

    std::string buffer;
    buffer.resize(size);
    size_t total = 0;
    while (true) {
        if (total == buffer.size()) {
            // File may have grown since fstat
            buffer.resize(buffer.size() + 4096);
        }
        ssize_t n = ::read(fd, buffer.data() + total, buffer.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            close(fd);
            return FileContent::failure("read failed: " + err);
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    close(fd);
    buffer.resize(total);

    return FileContent::from_buffer(std::move(buffer));
}

}  // namespace debtscan::util
