#include <offsync-cpp/types.hpp>

#include <charconv>
#include <chrono>
#include <random>

namespace offsync_cpp {

namespace {

constexpr auto hex_digits = std::string_view{"0123456789abcdef"};

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

auto ReplicaId::random() -> ReplicaId {
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto dist = std::uniform_int_distribution<unsigned>{0, 255};
    auto id = ReplicaId{};
    for (auto& b : id.bytes) {
        b = static_cast<std::byte>(dist(engine));
    }
    if (id.is_zero()) id.bytes[0] = std::byte{1};
    return id;
}

auto ReplicaId::to_hex() const -> std::string {
    auto out = std::string{};
    out.reserve(size * 2);
    for (auto b : bytes) {
        const auto v = static_cast<unsigned>(b);
        out.push_back(hex_digits[v >> 4]);
        out.push_back(hex_digits[v & 0x0F]);
    }
    return out;
}

auto ReplicaId::from_hex(std::string_view hex) -> std::optional<ReplicaId> {
    if (hex.size() != size * 2) return std::nullopt;
    auto id = ReplicaId{};
    for (std::size_t i = 0; i < size; ++i) {
        const auto hi = hex_value(hex[2 * i]);
        const auto lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id.bytes[i] = static_cast<std::byte>((hi << 4) | lo);
    }
    return id;
}

auto OperationId::to_string() const -> std::string {
    return std::to_string(counter) + "@" + replica.to_hex();
}

auto OperationId::parse(std::string_view text) -> std::optional<OperationId> {
    const auto at = text.find('@');
    if (at == std::string_view::npos || at == 0) return std::nullopt;

    auto counter = std::uint64_t{0};
    const auto* first = text.data();
    const auto* last = text.data() + at;
    auto [ptr, ec] = std::from_chars(first, last, counter);
    if (ec != std::errc{} || ptr != last) return std::nullopt;

    auto replica = ReplicaId::from_hex(text.substr(at + 1));
    if (!replica) return std::nullopt;
    return OperationId{counter, *replica};
}

auto Timestamp::now() -> Timestamp {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
}

}  // namespace offsync_cpp
