#pragma once

#include "model/Finding.hpp"
#include <string>
#include <vector>
#include <optional>

namespace debtscan::cache {

/**
 * Binary encoding of a file's findings for the cache blob.
 *
 * Layout (little-endian host order, same as the rest of the cache):
 *   u32 magic 'DSF1' | u32 count | count x record
 * record:
 *   str tag | str message | str file | u64 line | u64 column |
 *   opt<str> author | opt<str> issue | u8 priority (0 = none, 1..4) |
 *   str context_line
 * str = u32 length + bytes, opt<str> = u8 present + str
 */
class FindingCodec {
public:
    static std::string encode(const std::vector<model::FindingRecord>& findings);

    // Empty optional when the blob is truncated or malformed
    static std::optional<std::vector<model::FindingRecord>> decode(const std::string& blob);

    // SHA-256 of the blob as lowercase hex
    static std::string checksum(const std::string& blob);

private:
    static constexpr uint32_t MAGIC = 0x31465344;  // 'DSF1'
};

}  // namespace debtscan::cache
