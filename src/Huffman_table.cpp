#include "huff_table.h"
#include "parser_error.h"
#include "debug.h"

#include <utility>

DHT_type dht_type_from_nibbles(uint8_t table_class, uint8_t table_id){
    if(table_class == 0 && table_id == 0)
        return Luminance_DC;
    if(table_class == 0 && table_id == 1)
        return Luminance_AC;
    if(table_class == 1 && table_id == 0)
        return Chrominance_DC;
    if(table_class == 1 && table_id == 1)
        return Chrominance_AC;
    throw Parser_error::structure("unrecognized Huffman table class/id pair (%u,%u)",
        (unsigned) table_class, (unsigned) table_id);
}

const char *dht_type_str(DHT_type type){
    switch(type){
        case Luminance_DC:
            return "LuminanceDC";
        case Luminance_AC:
            return "LuminanceAC";
        case Chrominance_DC:
            return "ChrominanceDC";
        case Chrominance_AC:
            return "ChrominanceAC";
    }
    return "Unknown";
}

Huffman_table::Huffman_table(DHT_type type, Symbol_buckets symbols):
    type{type}, symbols{std::move(symbols)} {}

Huffman_table::Huffman_table(Bitstream &bs) {
    uint8_t class_id = bs.next_byte();
    this->type = dht_type_from_nibbles((class_id >> 4) & 0xF, class_id & 0xF);

    uint8_t num_codes_len_i[MAX_CODE_LEN];
    for(int i = 0; i < MAX_CODE_LEN; i++)
        num_codes_len_i[i] = bs.next_byte();

    for(int i = 0; i < MAX_CODE_LEN; i++)
        this->symbols[i] = bs.read_bytes(num_codes_len_i[i]);

    debug_print("DHT %s with %zu symbols\n", dht_type_str(this->type),
        this->get_total_symbols());
}

size_t Huffman_table::get_num_codes(uint8_t len) const {
    return this->get_symbols(len).size();
}

const std::vector<uint8_t> &Huffman_table::get_symbols(uint8_t len) const {
    if(len < 1 || len > MAX_CODE_LEN)
        throw Parser_error::structure("code length %u outside 1..%d", (unsigned) len, MAX_CODE_LEN);
    return this->symbols[len - 1];
}

size_t Huffman_table::get_total_symbols() const {
    size_t total = 0;
    for(const std::vector<uint8_t> &bucket: this->symbols)
        total += bucket.size();
    return total;
}

//Each code of length len uses 2^(16 - len) of the 2^16 leaves of the code tree
void Huffman_table::check_code_space() const {
    int64_t space = int64_t(1) << MAX_CODE_LEN;
    for(int len = 1; len <= MAX_CODE_LEN; len++)
        space -= int64_t(this->symbols[len - 1].size()) << (MAX_CODE_LEN - len);
    if(space < 0)
        throw Parser_error::structure("invalid Huffman code lengths in %s table",
            dht_type_str(this->type));
}

Code_map Huffman_table::build_code_map() const {
    check_code_space();

    Code_map translation;
    uint32_t code = 0;
    for(uint8_t len = 1; len <= MAX_CODE_LEN; len++){
        for(uint8_t symbol: this->symbols[len - 1]){
            Huffman_code key = {len, (uint16_t) code};
            translation[key] = symbol;
            debug_print("code len %2u bits 0x%04X -> 0x%02X\n", (unsigned) len, (unsigned) code, symbol);
            code++;
        }
        code = code << 1;
    }
    return translation;
}

std::vector<uint8_t> Huffman_table::huffman_decode(const uint8_t *data, size_t size) const {
    return entropy_decode(data, size, this->build_code_map());
}

std::vector<uint8_t> Huffman_table::huffman_decode(const std::vector<uint8_t> &data) const {
    return huffman_decode(data.data(), data.size());
}

std::vector<uint8_t> entropy_decode(const uint8_t *data, size_t size, const Code_map &codes){
    Bitstream bs(data, size);
    size_t bit_length = bs.bit_length();
    std::vector<uint8_t> result;

    size_t cursor = 0;
    while(cursor < bit_length){
        bool found = false;
        for(uint8_t len = 1; len <= MAX_CODE_LEN; len++){
            if(cursor + len > bit_length)
                break;

            Huffman_code key = {len, bs.bits_at(cursor, len)};
            Code_map::const_iterator it = codes.find(key);
            if(it != codes.end()){
                debug_print("bit %zu: %u bit code 0x%04X -> 0x%02X\n",
                    cursor, (unsigned) len, (unsigned) key.bits, it->second);
                result.push_back(it->second);
                cursor += len;
                found = true;
                break;
            }
        }
        if(!found)
            throw Parser_error::entropy(
                "error huffman decoding stream: symbol not found at bit cursor %zu with %zu bits remaining",
                cursor, bit_length - cursor);
    }
    return result;
}

std::vector<uint8_t> unstuff_scan_data(const uint8_t *data, size_t size){
    std::vector<uint8_t> unstuffed;
    unstuffed.reserve(size);
    for(size_t i = 0; i < size; i++){
        unstuffed.push_back(data[i]);
        if(data[i] == 0xFF && i + 1 < size && data[i + 1] == 0x00)
            i++;
    }
    return unstuffed;
}
