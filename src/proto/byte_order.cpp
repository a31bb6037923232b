#include "wirehdr/proto/byte_order.hpp"

namespace wirehdr::proto {

uint16_t read_le16(const uint8_t* data) {
    return static_cast<uint16_t>(static_cast<uint16_t>(data[0]) |
                                 (static_cast<uint16_t>(data[1]) << 8));
}

uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

uint64_t read_le64(const uint8_t* data) {
    return static_cast<uint64_t>(data[0]) |
           (static_cast<uint64_t>(data[1]) << 8) |
           (static_cast<uint64_t>(data[2]) << 16) |
           (static_cast<uint64_t>(data[3]) << 24) |
           (static_cast<uint64_t>(data[4]) << 32) |
           (static_cast<uint64_t>(data[5]) << 40) |
           (static_cast<uint64_t>(data[6]) << 48) |
           (static_cast<uint64_t>(data[7]) << 56);
}

void write_le16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void write_le32(uint8_t* data, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        data[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

void write_le64(uint8_t* data, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

} // namespace wirehdr::proto
