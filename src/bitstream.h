#pragma once
#include <stddef.h>
#include <stdint.h>
#include <vector>

//Read-only cursor over an encoded buffer. Every read is bounds checked and
//throws Parser_error instead of running off the end of the data.
class Bitstream{
public:
    Bitstream(const uint8_t *encoded_data, size_t size);
    explicit Bitstream(const std::vector<uint8_t> &encoded_data);

    uint8_t next_byte();
    uint16_t next_u16();
    void skip(size_t len);
    uint8_t peek(size_t index) const;
    Bitstream take(size_t len);
    std::vector<uint8_t> read_bytes(size_t len);
    //Bytes up to, not including, the first (first, second) pair.
    std::vector<uint8_t> take_until(uint8_t first, uint8_t second);

    size_t remaining() const {return this->size - this->offset;}
    size_t get_offset() const {return this->base + this->offset;}
    bool empty() const {return this->offset == this->size;}
    const uint8_t *get_data() const {return this->encoded_data + this->offset;}

    //MSB first bit access from the start of the stream
    size_t bit_length() const {return this->size * 8;}
    uint16_t bits_at(size_t bit_offset, uint8_t count) const;

private:
    Bitstream(const uint8_t *encoded_data, size_t size, size_t base);
    void check(size_t len) const;

    const uint8_t *encoded_data;
    size_t size;
    size_t offset = 0;
    size_t base = 0;  //offset of encoded_data inside the outer stream
};
