#include "quant_table.h"
#include "debug.h"

Quantization_table::Quantization_table(uint8_t id, const std::array<uint8_t, QUANT_TABLE_SIZE> &table):
    id{id}, table(table) {}

Quantization_table::Quantization_table(Bitstream &bs) {
    this->id = bs.next_byte();
    for(int i = 0; i < QUANT_TABLE_SIZE; i++)
        this->table[i] = bs.next_byte();

    debug_print("DQT id 0x%02X\n", this->id);
}
