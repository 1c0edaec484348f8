// Fuzz target for the LEB128 codec used by journal chunk headers and the
// record serializer: overflow, truncation and overlong encodings.

#include "src/encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    // A successful decode never consumes more than it was given.
    if (auto u = offsync_cpp::encoding::decode_uleb128(span)) {
        if (u->bytes_read > size) __builtin_trap();
    }
    if (auto s = offsync_cpp::encoding::decode_sleb128(span)) {
        if (s->bytes_read > size) __builtin_trap();
    }
    return 0;
}
