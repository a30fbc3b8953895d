/**
 * @file announce_codec.hpp
 * @brief Binary encoding of UDP service announcements.
 *
 * Wire format (all multi-byte values are big-endian):
 *
 *   [4B magic "SBRW"][1B version][1B kind: 1=announce, 2=goodbye][2B reserved]
 *   [4B ttl_ms]
 *   [2B len][service_type] [2B len][instance_name] [2B len][hostname]
 *   [2B port]
 *   [2B property_count] { [2B len][key] [2B len][value] } * property_count
 *
 * Addresses are not carried: the receiver takes them from the datagram's
 * source address.
 */

#pragma once

#include "core/result.hpp"
#include "transport/service_daemon.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace server_browser {

enum class AnnounceKind : uint8_t {
    Announce = 1,
    Goodbye = 2
};

struct AnnounceRecord {
    AnnounceKind kind{AnnounceKind::Announce};
    uint32_t ttl_ms{0};             ///< Receiver drops the record after this long without a refresh
    ServiceDescriptor service;      ///< addresses ignored when encoding
};

struct AnnounceCodec {
    static constexpr char MAGIC[4] = {'S', 'B', 'R', 'W'};
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 12;
    /// Keeps a datagram inside a typical Ethernet MTU.
    static constexpr size_t MAX_DATAGRAM_SIZE = 1400;

    static Result<std::vector<uint8_t>> encode(const AnnounceRecord& record);
    static Result<AnnounceRecord> decode(const uint8_t* data, size_t size);

    static void put_u16(std::vector<uint8_t>& buf, uint16_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static uint16_t get_u16(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace server_browser
