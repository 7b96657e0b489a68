#pragma once
#include <stdint.h>
#include <array>

#include "bitstream.h"

#define QUANT_TABLE_SIZE 64

//One table of a DQT segment, coefficients in file (zigzag) order
class Quantization_table{
public:
    Quantization_table(uint8_t id, const std::array<uint8_t, QUANT_TABLE_SIZE> &table);
    explicit Quantization_table(Bitstream &bs);

    //Raw id byte: precision in the high nibble, destination in the low one
    uint8_t get_id() const {return this->id;}
    uint8_t get_precision() const {return (this->id >> 4) & 0xF;}
    uint8_t get_destination() const {return this->id & 0xF;}
    const std::array<uint8_t, QUANT_TABLE_SIZE> &get_quantization_table() const {return this->table;}

    bool operator==(const Quantization_table &other) const {
        return id == other.id && table == other.table;
    }

private:
    uint8_t id;
    std::array<uint8_t, QUANT_TABLE_SIZE> table;
};
