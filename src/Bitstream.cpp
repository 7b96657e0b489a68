#include "bitstream.h"
#include "parser_error.h"

Bitstream::Bitstream(const uint8_t *encoded_data, size_t size):
    encoded_data{encoded_data}, size{size} {
    if(encoded_data == nullptr && size != 0)
        throw Parser_error::structure("null buffer of %zu bytes", size);
}

Bitstream::Bitstream(const std::vector<uint8_t> &encoded_data):
    Bitstream(encoded_data.data(), encoded_data.size()) {}

Bitstream::Bitstream(const uint8_t *encoded_data, size_t size, size_t base):
    encoded_data{encoded_data}, size{size}, base{base} {}

void Bitstream::check(size_t len) const {
    if(len > this->remaining())
        throw Parser_error::structure(
            "truncated input at offset %zu: need %zu bytes, %zu remaining",
            this->get_offset(), len, this->remaining());
}

uint8_t Bitstream::next_byte(){
    check(1);
    return this->encoded_data[this->offset++];
}

uint16_t Bitstream::next_u16(){
    check(2);
    uint16_t value = ((uint16_t) this->encoded_data[this->offset]) << 8;
    value += this->encoded_data[this->offset + 1];
    this->offset += 2;
    return value;
}

void Bitstream::skip(size_t len){
    check(len);
    this->offset += len;
}

uint8_t Bitstream::peek(size_t index) const {
    check(index + 1);
    return this->encoded_data[this->offset + index];
}

Bitstream Bitstream::take(size_t len){
    check(len);
    Bitstream sub(this->encoded_data + this->offset, len, this->get_offset());
    this->offset += len;
    return sub;
}

std::vector<uint8_t> Bitstream::read_bytes(size_t len){
    check(len);
    const uint8_t *start = this->encoded_data + this->offset;
    this->offset += len;
    return std::vector<uint8_t>(start, start + len);
}

std::vector<uint8_t> Bitstream::take_until(uint8_t first, uint8_t second){
    for(size_t i = this->offset; i + 1 < this->size; i++){
        if(this->encoded_data[i] == first && this->encoded_data[i + 1] == second)
            return read_bytes(i - this->offset);
    }
    throw Parser_error::structure(
        "input exhausted at offset %zu before marker 0x%02X%02X",
        this->base + this->size, first, second);
}

uint16_t Bitstream::bits_at(size_t bit_offset, uint8_t count) const {
    if(count == 0 || count > 16 || bit_offset + count > this->bit_length())
        throw Parser_error::structure(
            "bit read of %u bits at bit %zu outside %zu bits",
            (unsigned) count, bit_offset, this->bit_length());

    uint16_t value = 0;
    for(uint8_t i = 0; i < count; i++){
        size_t pos = bit_offset + i;
        uint8_t byte = this->encoded_data[pos / 8];
        value = (value << 1) | ((byte >> (7 - (pos % 8))) & 0x1);
    }
    return value;
}
