#include "JPEG_parser.hh"
#include "debug.h"

#include <fstream>
#include <utility>

#define QUANT_SEGMENT_LENGTH (2 + 1 + QUANT_TABLE_SIZE)

static uint16_t segment_length(Bitstream &bs, uint8_t tag, uint16_t minimum){
    uint16_t length = bs.next_u16();
    if(length < minimum)
        throw Parser_error::structure(
            "declared length %u of marker 0xFF%02X at offset %zu is below the minimum %u",
            (unsigned) length, tag, bs.get_offset() - 2, (unsigned) minimum);
    debug_print("marker 0xFF%02X length %u at offset %zu\n", tag, (unsigned) length, bs.get_offset() - 4);
    return length;
}

static Marker decode_huffman_tables(Bitstream &bs){
    uint16_t length = segment_length(bs, MARKER_DHT, 2);
    Bitstream segment = bs.take(length - 2);

    Huffman_segment dht;
    while(!segment.empty())
        dht.tables.push_back(Huffman_table(segment));
    return dht;
}

static Marker decode_quantization_table(Bitstream &bs){
    uint16_t length = segment_length(bs, MARKER_DQT, QUANT_SEGMENT_LENGTH);
    if(length != QUANT_SEGMENT_LENGTH)
        throw Parser_error::structure(
            "DQT segment at offset %zu declares %u bytes: only one table per segment is supported",
            bs.get_offset() - 2, (unsigned) length);

    return Quantization_segment{Quantization_table(bs)};
}

//The length field is skipped; the payload runs to the first 0xFFD9
static Marker decode_scan(Bitstream &bs){
    segment_length(bs, MARKER_SOS, 2);
    Scan_header header(bs);
    std::vector<uint8_t> scan_data = bs.take_until(0xFF, MARKER_EOI);
    debug_print("SOS payload of %zu bytes\n", scan_data.size());
    return Scan_segment{std::move(header), std::move(scan_data)};
}

static Marker decode_generic(Bitstream &bs, uint8_t tag){
    uint16_t length = segment_length(bs, tag, 2);
    Generic_marker marker;
    marker.tag = tag;
    marker.length = length - 2;
    marker.data = bs.read_bytes(marker.length);
    return marker;
}

std::vector<Marker> decode_jpeg_markers(const uint8_t *data, size_t size){
    Bitstream bs(data, size);

    if(bs.remaining() < 2 || bs.peek(0) != 0xFF || bs.peek(1) != MARKER_SOI)
        throw Parser_error::structure("missing start of image marker 0xFFD8");
    bs.skip(2);

    std::vector<Marker> markers;
    while(true){
        if(bs.remaining() < 2)
            throw Parser_error::structure("input exhausted at offset %zu before end of image marker",
                bs.get_offset());

        size_t offset = bs.get_offset();
        uint8_t first_byte = bs.next_byte();
        if(first_byte != 0xFF)
            throw Parser_error::structure("expected marker at offset %zu, found 0x%02X",
                offset, first_byte);

        uint8_t tag = bs.next_byte();
        switch(tag){
            case MARKER_EOI:
                debug_print("marker 0xFF%02X at offset %zu\n", tag, offset);
                if(!bs.empty())
                    debug_print("ignoring %zu bytes after end of image\n", bs.remaining());
                return markers;
            case MARKER_SOS:
                markers.push_back(decode_scan(bs));
                break;
            case MARKER_DHT:
                markers.push_back(decode_huffman_tables(bs));
                break;
            case MARKER_DQT:
                markers.push_back(decode_quantization_table(bs));
                break;
            default:
                markers.push_back(decode_generic(bs, tag));
                break;
        }
    }
}

jpeg_image::jpeg_image(const char* path): p{path} {
    std::error_code ec;
    bool present = std::filesystem::exists(p, ec);
    if(ec)
        throw Parser_error::structure("cannot stat %s: %s", path, ec.message().c_str());
    if(!present)
        throw Parser_error::structure("%s does not exist", path);

    uintmax_t size = std::filesystem::file_size(p, ec);
    if(ec)
        throw Parser_error::structure("cannot stat %s: %s", path, ec.message().c_str());

    std::ifstream image(p, std::ios::binary);
    if(!image.is_open())
        throw Parser_error::structure("cannot open %s", path);

    data.resize(size);
    image.read(reinterpret_cast<char*>(data.data()), size);
    if(image.fail())
        throw Parser_error::structure("short read of %s", path);

    this->find_markers();
}

jpeg_image::jpeg_image(const void *data, uint64_t size) {
    const uint8_t *bytes = static_cast<const uint8_t *>(data);
    if(bytes == nullptr && size != 0)
        throw Parser_error::structure("null buffer of %llu bytes", (unsigned long long) size);
    if(bytes != nullptr)
        this->data.assign(bytes, bytes + size);
    this->find_markers();
}

void jpeg_image::find_markers(){
    this->markers = decode_jpeg_markers(this->data.data(), this->data.size());
}

const Huffman_table *jpeg_image::get_huffman_table(DHT_type type) const {
    const Huffman_table *found = nullptr;
    for(const Marker &marker: this->markers){
        const Huffman_segment *dht = std::get_if<Huffman_segment>(&marker);
        if(dht == nullptr)
            continue;
        for(const Huffman_table &table: dht->tables){
            if(table.get_type() == type)
                found = &table;
        }
    }
    return found;
}

const Quantization_table *jpeg_image::get_quantization_table(uint8_t id) const {
    const Quantization_table *found = nullptr;
    for(const Marker &marker: this->markers){
        const Quantization_segment *dqt = std::get_if<Quantization_segment>(&marker);
        if(dqt != nullptr && dqt->table.get_id() == id)
            found = &dqt->table;
    }
    return found;
}

const Scan_segment *jpeg_image::get_scan(size_t index) const {
    for(const Marker &marker: this->markers){
        const Scan_segment *scan = std::get_if<Scan_segment>(&marker);
        if(scan == nullptr)
            continue;
        if(index == 0)
            return scan;
        index--;
    }
    return nullptr;
}

size_t jpeg_image::get_num_scans() const {
    size_t count = 0;
    for(const Marker &marker: this->markers){
        if(std::holds_alternative<Scan_segment>(marker))
            count++;
    }
    return count;
}

std::vector<uint8_t> jpeg_image::decode_scan(size_t index, DHT_type type, bool unstuff) const {
    const Scan_segment *scan = this->get_scan(index);
    if(scan == nullptr)
        throw Parser_error::structure("no scan %zu in image", index);

    const Huffman_table *table = this->get_huffman_table(type);
    if(table == nullptr)
        throw Parser_error::structure("no %s Huffman table in image", dht_type_str(type));

    if(unstuff){
        std::vector<uint8_t> scan_data = unstuff_scan_data(scan->data.data(), scan->data.size());
        return table->huffman_decode(scan_data);
    }
    return table->huffman_decode(scan->data);
}
