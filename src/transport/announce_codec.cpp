/**
 * @file announce_codec.cpp
 * @brief AnnounceCodec serialization.
 */

#include "transport/announce_codec.hpp"

#include <cstring>
#include <limits>
#include <string>

namespace server_browser {

namespace {

bool put_string(std::vector<uint8_t>& buf, std::string_view text) {
    if (text.size() > std::numeric_limits<uint16_t>::max()) return false;
    AnnounceCodec::put_u16(buf, static_cast<uint16_t>(text.size()));
    buf.insert(buf.end(), text.begin(), text.end());
    return true;
}

/// Bounds-checked cursor over a received datagram.
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool u16(uint16_t& out) {
        if (remaining() < 2) return false;
        out = AnnounceCodec::get_u16(data_ + offset_);
        offset_ += 2;
        return true;
    }

    bool u32(uint32_t& out) {
        if (remaining() < 4) return false;
        out = AnnounceCodec::get_u32(data_ + offset_);
        offset_ += 4;
        return true;
    }

    bool string(std::string& out) {
        uint16_t len = 0;
        if (!u16(len) || remaining() < len) return false;
        out.assign(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return true;
    }

    [[nodiscard]] size_t remaining() const noexcept { return size_ - offset_; }

    void skip(size_t n) { offset_ += n; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void AnnounceCodec::put_u16(std::vector<uint8_t>& buf, uint16_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void AnnounceCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint16_t AnnounceCodec::get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t AnnounceCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Encode / Decode
// ─────────────────────────────────────────────

Result<std::vector<uint8_t>> AnnounceCodec::encode(const AnnounceRecord& record) {
    const auto& service = record.service;
    if (service.properties.size() > std::numeric_limits<uint16_t>::max()) {
        return Error{"too many properties"};
    }

    std::vector<uint8_t> buf;
    buf.reserve(256);

    buf.insert(buf.end(), MAGIC, MAGIC + 4);
    buf.push_back(VERSION);
    buf.push_back(static_cast<uint8_t>(record.kind));
    put_u16(buf, 0);
    put_u32(buf, record.ttl_ms);

    bool fits = put_string(buf, service.service_type)
             && put_string(buf, service.instance_name)
             && put_string(buf, service.hostname);
    put_u16(buf, service.port);
    put_u16(buf, static_cast<uint16_t>(service.properties.size()));
    for (const auto& [key, value] : service.properties) {
        fits = fits && put_string(buf, key) && put_string(buf, value);
    }

    if (!fits || buf.size() > MAX_DATAGRAM_SIZE) {
        return Error{"announcement for " + service.fullname() + " exceeds "
                     + std::to_string(MAX_DATAGRAM_SIZE) + " bytes"};
    }
    return buf;
}

Result<AnnounceRecord> AnnounceCodec::decode(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE) return Error{"datagram too short"};
    if (std::memcmp(data, MAGIC, 4) != 0) return Error{"bad magic"};
    if (data[4] != VERSION) {
        return Error{"unsupported version " + std::to_string(data[4])};
    }

    AnnounceRecord record;
    switch (data[5]) {
        case static_cast<uint8_t>(AnnounceKind::Announce): record.kind = AnnounceKind::Announce; break;
        case static_cast<uint8_t>(AnnounceKind::Goodbye):  record.kind = AnnounceKind::Goodbye; break;
        default: return Error{"unknown record kind " + std::to_string(data[5])};
    }

    Reader reader(data, size);
    reader.skip(8);
    uint16_t property_count = 0;
    auto& service = record.service;
    bool ok = reader.u32(record.ttl_ms)
           && reader.string(service.service_type)
           && reader.string(service.instance_name)
           && reader.string(service.hostname)
           && reader.u16(service.port)
           && reader.u16(property_count);
    for (uint16_t i = 0; ok && i < property_count; ++i) {
        std::string key, value;
        ok = reader.string(key) && reader.string(value);
        if (ok) service.properties.set(key, value);
    }

    if (!ok) return Error{"truncated announcement"};
    if (reader.remaining() != 0) return Error{"trailing bytes after announcement"};
    return record;
}

}  // namespace server_browser
