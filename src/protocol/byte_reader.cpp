#include "protocol/byte_reader.hpp"

namespace odal {

ReadOverrun::ReadOverrun(std::size_t offset, std::size_t wanted, std::size_t size)
    : std::out_of_range("read of " + std::to_string(wanted) + " byte(s) at offset " + std::to_string(offset)
                        + " overruns " + std::to_string(size) + "-byte buffer") {}

ByteReader::ByteReader(std::span<const uint8_t> buffer) : buffer(buffer) {}

void ByteReader::require(std::size_t count) const {
    if (count > remaining()) {
        throw ReadOverrun(offset, count, buffer.size());
    }
}

uint8_t ByteReader::readU8() {
    require(1);
    return buffer[offset++];
}

uint16_t ByteReader::readU16() {
    require(2);
    const uint16_t value = static_cast<uint16_t>(buffer[offset] | (buffer[offset + 1] << 8));
    offset += 2;
    return value;
}

uint32_t ByteReader::readU32() {
    require(4);
    const uint32_t value = static_cast<uint32_t>(buffer[offset])
        | (static_cast<uint32_t>(buffer[offset + 1]) << 8)
        | (static_cast<uint32_t>(buffer[offset + 2]) << 16)
        | (static_cast<uint32_t>(buffer[offset + 3]) << 24);
    offset += 4;
    return value;
}

std::string ByteReader::readString() {
    std::string value;
    while (offset < buffer.size()) {
        const uint8_t ch = buffer[offset++];
        if (ch == 0) {
            break;
        }
        value.push_back(static_cast<char>(ch));
    }
    return value;
}

std::string ByteReader::readHexString() {
    const std::size_t size = readU8();
    require(size);

    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        const uint8_t byte = buffer[offset + i];
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0F]);
    }
    offset += size;
    return hex;
}

void ByteReader::skip(std::size_t count) {
    require(count);
    offset += count;
}

} // namespace odal
