#include "JPEG_parser.hh"

#include <cstring>
#include <iostream>

static void usage(const char *prog){
    std::cerr << "usage: " << prog << " <file.jpg> [--decode lum-dc|lum-ac|chr-dc|chr-ac]" << std::endl;
}

static bool parse_table_name(const char *name, DHT_type *type){
    if(strcmp(name, "lum-dc") == 0) *type = Luminance_DC;
    else if(strcmp(name, "lum-ac") == 0) *type = Luminance_AC;
    else if(strcmp(name, "chr-dc") == 0) *type = Chrominance_DC;
    else if(strcmp(name, "chr-ac") == 0) *type = Chrominance_AC;
    else return false;
    return true;
}

static void print_marker(const Marker &marker){
    std::cout << marker_name(marker) << " 0xFF" << std::hex << std::uppercase << (int) marker_tag(marker) << std::dec;

    if(const Generic_marker *m = std::get_if<Generic_marker>(&marker)){
        std::cout << " length: " << m->length;
    }
    else if(const Huffman_segment *dht = std::get_if<Huffman_segment>(&marker)){
        for(const Huffman_table &table: dht->tables)
            std::cout << " " << dht_type_str(table.get_type()) << " (" << table.get_total_symbols() << " symbols)";
    }
    else if(const Quantization_segment *dqt = std::get_if<Quantization_segment>(&marker)){
        std::cout << " id: " << (int) dqt->table.get_id();
    }
    else if(const Scan_segment *scan = std::get_if<Scan_segment>(&marker)){
        const Scan_header &header = scan->header;
        std::cout << " precision: " << (int) header.get_precision()
            << " height: " << header.get_height()
            << " width: " << header.get_width()
            << " components: " << (int) header.get_num_chans();
        for(uint8_t i = 0; i < header.get_num_chans(); i++){
            const Channel_info *chan_info = header.get_chan_info(i);
            std::cout << " [id " << (int) chan_info->id
                << " " << (int) chan_info->horz_sampling << "x" << (int) chan_info->vert_sampling
                << " q" << (int) chan_info->qtableID << "]";
        }
        std::cout << " data: " << scan->data.size() << " bytes";
    }
    std::cout << std::endl;
}

int main(int argc, char **argv){
    if(argc != 2 && argc != 4){
        usage(argv[0]);
        return 1;
    }

    DHT_type decode_type = Luminance_DC;
    bool decode = false;
    if(argc == 4){
        if(strcmp(argv[2], "--decode") != 0 || !parse_table_name(argv[3], &decode_type)){
            usage(argv[0]);
            return 1;
        }
        decode = true;
    }

    try{
        jpeg_image jpeg = jpeg_image(argv[1]);
        std::cout << argv[1] << ": " << jpeg.get_size() << " bytes, "
            << jpeg.get_num_markers() << " markers" << std::endl;
        for(const Marker &marker: jpeg.get_markers())
            print_marker(marker);

        if(decode){
            std::vector<uint8_t> symbols = jpeg.decode_scan(0, decode_type, true);
            std::cout << "Decoded " << symbols.size() << " symbols with " << dht_type_str(decode_type) << ":";
            for(uint8_t symbol: symbols)
                std::cout << " " << std::hex << (int) symbol;
            std::cout << std::dec << std::endl;
        }
    }
    catch(const Parser_error &e){
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
