#pragma once
#include <stddef.h>
#include <stdint.h>
#include <filesystem>
#include <vector>

#include "marker.h"
#include "parser_error.h"

//Scans a whole JPEG file into its segments, in file order. SOI and EOI are
//consumed but not listed; anything after EOI is ignored. Throws Parser_error.
std::vector<Marker> decode_jpeg_markers(const uint8_t *data, size_t size);

class jpeg_image{
public:
    explicit jpeg_image(const char* path);
    jpeg_image(const void *data, uint64_t size);

    uint64_t get_size() const {return this->data.size();}
    const std::vector<Marker> &get_markers() const {return this->markers;}
    size_t get_num_markers() const {return this->markers.size();}

    //Last table of the given type in file order, or nullptr
    const Huffman_table *get_huffman_table(DHT_type type) const;
    const Quantization_table *get_quantization_table(uint8_t id) const;
    const Scan_segment *get_scan(size_t index) const;
    size_t get_num_scans() const;

    std::vector<uint8_t> decode_scan(size_t index, DHT_type type, bool unstuff) const;

private:
    void find_markers();

    std::filesystem::path p;
    std::vector<uint8_t> data;
    std::vector<Marker> markers;
};
