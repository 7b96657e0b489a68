#pragma once
#include <stdint.h>
#include <stddef.h>
#include <array>
#include <map>
#include <vector>

#include "bitstream.h"

#define MAX_CODE_LEN 16

//(class nibble, id nibble) of a table definition
enum DHT_type: uint8_t {
    Luminance_DC,    //(0,0)
    Luminance_AC,    //(0,1)
    Chrominance_DC,  //(1,0)
    Chrominance_AC,  //(1,1)
};

DHT_type dht_type_from_nibbles(uint8_t table_class, uint8_t table_id);

const char *dht_type_str(DHT_type type);

//A code of `length` bits, right aligned in `bits`
struct Huffman_code{
    uint8_t length;
    uint16_t bits;

    bool operator<(const Huffman_code &other) const {
        if(length != other.length)
            return length < other.length;
        return bits < other.bits;
    }
    bool operator==(const Huffman_code &other) const {
        return length == other.length && bits == other.bits;
    }
};

typedef std::map<Huffman_code, uint8_t> Code_map;

typedef std::array<std::vector<uint8_t>, MAX_CODE_LEN> Symbol_buckets;

class Huffman_table{
public:
    Huffman_table(DHT_type type, Symbol_buckets symbols);
    //Parses one table definition: class/id byte, 16 counts, symbols
    explicit Huffman_table(Bitstream &bs);

    DHT_type get_type() const {return this->type;}
    //len is the code length, 1..16
    size_t get_num_codes(uint8_t len) const;
    const std::vector<uint8_t> &get_symbols(uint8_t len) const;
    size_t get_total_symbols() const;
    const Symbol_buckets &get_symbol_buckets() const {return this->symbols;}

    Code_map build_code_map() const;
    std::vector<uint8_t> huffman_decode(const uint8_t *data, size_t size) const;
    std::vector<uint8_t> huffman_decode(const std::vector<uint8_t> &data) const;

    bool operator==(const Huffman_table &other) const {
        return type == other.type && symbols == other.symbols;
    }

private:
    void check_code_space() const;

    DHT_type type;
    Symbol_buckets symbols;  //symbols[len - 1] holds the codes of length len
};

std::vector<uint8_t> entropy_decode(const uint8_t *data, size_t size, const Code_map &codes);

//Collapses every 0xFF 0x00 pair of entropy coded data to 0xFF
std::vector<uint8_t> unstuff_scan_data(const uint8_t *data, size_t size);
