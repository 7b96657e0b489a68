#pragma once
#include <stdint.h>
#include <variant>
#include <vector>

#include "huff_table.h"
#include "quant_table.h"
#include "scan_header.h"

//Marker codes the scanner tells apart
enum Marker_code: uint8_t {
    MARKER_DHT = 0xC4,
    MARKER_SOI = 0xD8,
    MARKER_EOI = 0xD9,
    MARKER_SOS = 0xDA,
    MARKER_DQT = 0xDB,
};

//Any segment without a dedicated parser
struct Generic_marker{
    uint8_t tag;
    uint16_t length;  //payload length, without the two length bytes
    std::vector<uint8_t> data;

    bool operator==(const Generic_marker &other) const {
        return tag == other.tag && length == other.length && data == other.data;
    }
};

struct Huffman_segment{
    std::vector<Huffman_table> tables;

    bool operator==(const Huffman_segment &other) const {return tables == other.tables;}
};

struct Quantization_segment{
    Quantization_table table;

    bool operator==(const Quantization_segment &other) const {return table == other.table;}
};

struct Scan_segment{
    Scan_header header;
    std::vector<uint8_t> data;  //entropy coded bytes up to EOI, still byte stuffed

    bool operator==(const Scan_segment &other) const {
        return header == other.header && data == other.data;
    }
};

typedef std::variant<Generic_marker, Huffman_segment, Quantization_segment, Scan_segment> Marker;

uint8_t marker_tag(const Marker &marker);

const char *marker_name(const Marker &marker);
