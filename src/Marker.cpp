#include "marker.h"

namespace {

struct Tag_visitor{
    uint8_t operator()(const Generic_marker &m) const {return m.tag;}
    uint8_t operator()(const Huffman_segment &) const {return MARKER_DHT;}
    uint8_t operator()(const Quantization_segment &) const {return MARKER_DQT;}
    uint8_t operator()(const Scan_segment &) const {return MARKER_SOS;}
};

struct Name_visitor{
    const char *operator()(const Generic_marker &) const {return "Other";}
    const char *operator()(const Huffman_segment &) const {return "DHT";}
    const char *operator()(const Quantization_segment &) const {return "DQT";}
    const char *operator()(const Scan_segment &) const {return "Image";}
};

}

uint8_t marker_tag(const Marker &marker){
    return std::visit(Tag_visitor{}, marker);
}

const char *marker_name(const Marker &marker){
    return std::visit(Name_visitor{}, marker);
}
