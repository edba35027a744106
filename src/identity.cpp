#include "identity.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>

namespace beam {

namespace {

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t kRandomIdLength = 13;
constexpr size_t kRoomIdLength = 6;

std::mt19937_64& Rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

std::string RandomBase36(size_t length) {
    std::uniform_int_distribution<size_t> dist(0, 35);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(kBase36[dist(Rng())]);
    }
    return out;
}

std::string ToBase36(uint64_t value) {
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kBase36[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

int64_t NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string GeneratePeerId() {
    return RandomBase36(kRandomIdLength) + ToBase36(static_cast<uint64_t>(NowMillis()));
}

std::string GenerateMessageId() {
    return GeneratePeerId();
}

std::string GenerateRoomId() {
    auto id = RandomBase36(kRoomIdLength);
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return id;
}

std::string NormalizeRoomId(std::string_view roomId) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!roomId.empty() && isSpace(roomId.front())) {
        roomId.remove_prefix(1);
    }
    while (!roomId.empty() && isSpace(roomId.back())) {
        roomId.remove_suffix(1);
    }

    std::string out(roomId);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

PeerIdentity MakeIdentity(const std::string& displayName) {
    return PeerIdentity{GeneratePeerId(), displayName};
}

} // namespace beam
