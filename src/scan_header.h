#pragma once
#include <stdint.h>
#include <vector>

#include "bitstream.h"

struct Channel_info{
    uint8_t id;
    uint8_t horz_sampling;
    uint8_t vert_sampling;
    uint8_t qtableID;

    bool operator==(const Channel_info &other) const {
        return id == other.id && horz_sampling == other.horz_sampling &&
            vert_sampling == other.vert_sampling && qtableID == other.qtableID;
    }
};

//Metadata that opens a scan segment
class Scan_header{
public:
    Scan_header(uint8_t precision, uint16_t height, uint16_t width, std::vector<Channel_info> chan_infos);
    explicit Scan_header(Bitstream &bs);

    uint8_t get_precision() const {return this->precision;}
    uint16_t get_height() const {return this->height;}
    uint16_t get_width() const {return this->width;}
    uint8_t get_num_chans() const {return (uint8_t) this->chan_infos.size();}
    const Channel_info *get_chan_info(uint8_t index) const {
        if(index < this->chan_infos.size()) return &this->chan_infos[index];
        else return nullptr;
    }

    bool operator==(const Scan_header &other) const {
        return precision == other.precision && height == other.height &&
            width == other.width && chan_infos == other.chan_infos;
    }

private:
    uint8_t precision;
    uint16_t height;
    uint16_t width;
    std::vector<Channel_info> chan_infos;
};
