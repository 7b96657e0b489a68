#include "scan_header.h"
#include "debug.h"

#include <utility>

Scan_header::Scan_header(uint8_t precision, uint16_t height, uint16_t width, std::vector<Channel_info> chan_infos):
    precision{precision}, height{height}, width{width}, chan_infos{std::move(chan_infos)} {}

Scan_header::Scan_header(Bitstream &bs) {
    this->precision = bs.next_byte();
    this->height = bs.next_u16();
    this->width = bs.next_u16();

    uint8_t num_chans = bs.next_byte();
    this->chan_infos.resize(num_chans);
    for(int i = 0; i < num_chans; i++){
        this->chan_infos[i].id = bs.next_byte();

        uint8_t sampling = bs.next_byte();
        this->chan_infos[i].horz_sampling = (sampling >> 4) & 0xF;
        this->chan_infos[i].vert_sampling = sampling & 0xF;

        this->chan_infos[i].qtableID = bs.next_byte();
    }

    debug_print("SOS precision %u, %ux%u, %u components\n", (unsigned) this->precision,
        (unsigned) this->width, (unsigned) this->height, (unsigned) num_chans);
}
