#include "cache/FindingCodec.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace debtscan::cache {

namespace {

template <typename T>
void write_pod(std::string& out, const T& value) {
    out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

void write_string(std::string& out, const std::string& s) {
    uint32_t len = static_cast<uint32_t>(s.length());
    write_pod(out, len);
    out.append(s);
}

void write_optional(std::string& out, const std::optional<std::string>& s) {
    uint8_t present = s.has_value() ? 1 : 0;
    write_pod(out, present);
    if (present) write_string(out, *s);
}

// Bounds-checked cursor over the blob; any short read poisons it
class Reader {
public:
    explicit Reader(const std::string& data) : data_(data) {}

    template <typename T>
    bool read_pod(T& value) {
        if (!ok_ || data_.size() - pos_ < sizeof(T)) return ok_ = false;
        std::memcpy(&value, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }

    bool read_string(std::string& s) {
        uint32_t len = 0;
        if (!read_pod(len)) return false;
        if (data_.size() - pos_ < len) return ok_ = false;
        s.assign(data_.data() + pos_, len);
        pos_ += len;
        return true;
    }

    bool read_optional(std::optional<std::string>& s) {
        uint8_t present = 0;
        if (!read_pod(present)) return false;
        if (present > 1) return ok_ = false;
        if (!present) {
            s.reset();
            return true;
        }
        std::string value;
        if (!read_string(value)) return false;
        s = std::move(value);
        return true;
    }

    bool at_end() const { return pos_ == data_.size(); }

private:
    const std::string& data_;
    size_t pos_ = 0;
    bool ok_ = true;
};

}  // namespace

std::string FindingCodec::encode(const std::vector<model::FindingRecord>& findings) {
    std::string out;
    write_pod(out, MAGIC);
    write_pod(out, static_cast<uint32_t>(findings.size()));

    for (const auto& f : findings) {
        write_string(out, f.tag.as_str());
        write_string(out, f.message);
        write_string(out, f.file);
        write_pod(out, static_cast<uint64_t>(f.line));
        write_pod(out, static_cast<uint64_t>(f.column));
        write_optional(out, f.author);
        write_optional(out, f.issue);
        uint8_t priority = f.priority ? static_cast<uint8_t>(static_cast<int>(*f.priority) + 1) : 0;
        write_pod(out, priority);
        write_string(out, f.context_line);
    }
    return out;
}

std::optional<std::vector<model::FindingRecord>> FindingCodec::decode(const std::string& blob) {
    Reader in(blob);

    uint32_t magic = 0;
    uint32_t count = 0;
    if (!in.read_pod(magic) || magic != MAGIC) return std::nullopt;
    if (!in.read_pod(count)) return std::nullopt;

    std::vector<model::FindingRecord> findings;
    findings.reserve(std::min<uint32_t>(count, 4096));

    for (uint32_t i = 0; i < count; ++i) {
        model::FindingRecord f;
        std::string tag;
        uint64_t line = 0;
        uint64_t column = 0;
        uint8_t priority = 0;

        if (!in.read_string(tag) || !in.read_string(f.message) || !in.read_string(f.file) ||
            !in.read_pod(line) || !in.read_pod(column) ||
            !in.read_optional(f.author) || !in.read_optional(f.issue) ||
            !in.read_pod(priority) || !in.read_string(f.context_line)) {
            return std::nullopt;
        }
        if (line == 0 || priority > 4) return std::nullopt;

        f.tag = model::Tag::from_name(tag);
        f.line = static_cast<size_t>(line);
        f.column = static_cast<size_t>(column);
        if (priority > 0) f.priority = static_cast<model::Priority>(priority - 1);
        findings.push_back(std::move(f));
    }

    if (!in.at_end()) return std::nullopt;
    return findings;
}

std::string FindingCodec::checksum(const std::string& blob) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(blob.data()), blob.size(), hash);

    std::ostringstream hex;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return hex.str();
}

}  // namespace debtscan::cache
