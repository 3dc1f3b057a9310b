#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace odal {

class ReadOverrun : public std::out_of_range {
public:
    ReadOverrun(std::size_t offset, std::size_t wanted, std::size_t size);
};

// Little-endian cursor over a received datagram. Every read is bounds checked
// and throws ReadOverrun instead of touching memory past the end.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> buffer);

    std::size_t position() const {
        return offset;
    }
    std::size_t remaining() const {
        return buffer.size() - offset;
    }
    bool atEnd() const {
        return offset >= buffer.size();
    }

    uint8_t readU8();
    uint16_t readU16();
    uint32_t readU32();

    // Bytes up to and including a NUL, or to the end of the buffer; empty once exhausted.
    std::string readString();
    // u8 length followed by that many raw bytes, rendered as lowercase hex.
    std::string readHexString();

    void skip(std::size_t count);

private:
    void require(std::size_t count) const;

    std::span<const uint8_t> buffer;
    std::size_t offset = 0;
};

} // namespace odal
