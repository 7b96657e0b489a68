#include <catch2/catch.hpp>

#include "huff_table.h"
#include "parser_error.h"
#include "test_tables.h"

static bool is_prefix_free(const Code_map &codes){
    for(const auto &shorter: codes){
        for(const auto &longer: codes){
            if(shorter.first.length >= longer.first.length)
                continue;
            uint8_t shift = longer.first.length - shorter.first.length;
            if((longer.first.bits >> shift) == shorter.first.bits)
                return false;
        }
    }
    return true;
}

TEST_CASE("Canonical codes of the AC chrominance table", "[huffman]") {
    Huffman_table table(Chrominance_AC, chrominance_ac_symbols());
    Code_map translation = table.build_code_map();

    REQUIRE(translation.size() == table.get_total_symbols());
    REQUIRE(translation.at(Huffman_code{2, 0b00}) == 0x01);
    REQUIRE(translation.at(Huffman_code{3, 0b010}) == 0x02);
    REQUIRE(translation.at(Huffman_code{3, 0b011}) == 0x11);
    REQUIRE(translation.at(Huffman_code{4, 0b1001}) == 0x03);
    REQUIRE(translation.at(Huffman_code{4, 0b1010}) == 0x04);
    REQUIRE(translation.at(Huffman_code{4, 0b1011}) == 0x21);
    REQUIRE(translation.count(Huffman_code{1, 0}) == 0);
    //length is part of the key: 0b00 as a 3 bit code is not 0x01
    REQUIRE(translation.count(Huffman_code{3, 0b000}) == 0);
}

TEST_CASE("Canonical codes are prefix free", "[huffman]") {
    REQUIRE(is_prefix_free(Huffman_table(Chrominance_AC, chrominance_ac_symbols()).build_code_map()));
    REQUIRE(is_prefix_free(Huffman_table(Luminance_DC, luminance_dc_symbols()).build_code_map()));

    Symbol_buckets one_per_length;
    for(int i = 0; i < MAX_CODE_LEN; i++)
        one_per_length[i].push_back((uint8_t) i);
    Code_map skewed = Huffman_table(Luminance_AC, one_per_length).build_code_map();
    REQUIRE(skewed.size() == 16);
    REQUIRE(is_prefix_free(skewed));
    REQUIRE(skewed.at(Huffman_code{16, 0xFFFE}) == 15);
}

TEST_CASE("Empty buckets still shift the running code", "[huffman]") {
    Code_map translation = Huffman_table(Luminance_DC, luminance_dc_symbols()).build_code_map();

    REQUIRE(translation.at(Huffman_code{2, 0b00}) == 0x00);
    REQUIRE(translation.at(Huffman_code{3, 0b010}) == 0x01);
    REQUIRE(translation.at(Huffman_code{3, 0b110}) == 0x05);
    REQUIRE(translation.at(Huffman_code{4, 0b1110}) == 0x06);
    REQUIRE(translation.at(Huffman_code{9, 0b111111110}) == 0x0b);
}

TEST_CASE("Code lengths that overflow the code space are rejected", "[huffman]") {
    Symbol_buckets full;
    full[0] = {0x0A, 0x0B};
    Code_map translation = Huffman_table(Luminance_DC, full).build_code_map();
    REQUIRE(translation.at(Huffman_code{1, 0}) == 0x0A);
    REQUIRE(translation.at(Huffman_code{1, 1}) == 0x0B);

    Symbol_buckets overfull;
    overfull[0] = {0x0A, 0x0B};
    overfull[3] = {0x0C};
    Huffman_table table(Luminance_DC, overfull);
    try{
        table.build_code_map();
        FAIL("expected Parser_error");
    }
    catch(const Parser_error &e){
        REQUIRE(e.get_cause() == Error_cause::Structure);
        REQUIRE_THAT(e.what(), Catch::Contains("invalid Huffman code lengths"));
    }
}

TEST_CASE("Class and id nibbles select the table type", "[huffman]") {
    REQUIRE(dht_type_from_nibbles(0, 0) == Luminance_DC);
    REQUIRE(dht_type_from_nibbles(0, 1) == Luminance_AC);
    REQUIRE(dht_type_from_nibbles(1, 0) == Chrominance_DC);
    REQUIRE(dht_type_from_nibbles(1, 1) == Chrominance_AC);
    REQUIRE_THROWS_WITH(dht_type_from_nibbles(0, 2), Catch::Contains("(0,2)"));
    REQUIRE_THROWS_AS(dht_type_from_nibbles(2, 0), Parser_error);
    REQUIRE(std::string(dht_type_str(Chrominance_DC)) == "ChrominanceDC");
}

TEST_CASE("Huffman_table parses one table definition", "[huffman]") {
    std::vector<uint8_t> def = table_definition(0x11, chrominance_ac_symbols());
    def.push_back(0xEE);
    Bitstream bs(def);

    Huffman_table table(bs);
    REQUIRE(table.get_type() == Chrominance_AC);
    REQUIRE(table.get_num_codes(1) == 0);
    REQUIRE(table.get_num_codes(4) == 4);
    REQUIRE(table.get_symbols(3) == std::vector<uint8_t>{0x02, 0x11});
    REQUIRE(table.get_total_symbols() == 67);
    REQUIRE(table == Huffman_table(Chrominance_AC, chrominance_ac_symbols()));
    REQUIRE(bs.remaining() == 1);

    REQUIRE_THROWS_AS(table.get_symbols(0), Parser_error);
    REQUIRE_THROWS_AS(table.get_symbols(17), Parser_error);
}

TEST_CASE("Huffman_table rejects truncated definitions", "[huffman]") {
    std::vector<uint8_t> def = table_definition(0x00, luminance_dc_symbols());
    def.pop_back();
    Bitstream bs(def);
    REQUIRE_THROWS_WITH(Huffman_table(bs), Catch::Contains("truncated input"));

    std::vector<uint8_t> bad_pair = table_definition(0x21, luminance_dc_symbols());
    Bitstream bad(bad_pair);
    REQUIRE_THROWS_WITH(Huffman_table(bad), Catch::Contains("class/id pair (2,1)"));
}

TEST_CASE("Symbol counts are not limited to one byte", "[huffman]") {
    Symbol_buckets buckets;
    for(size_t i = 0; i < 300; i++)
        buckets[15].push_back((uint8_t) i);
    Huffman_table table(Luminance_AC, buckets);

    REQUIRE(table.get_num_codes(16) == 300);
    REQUIRE(table.get_total_symbols() == 300);

    Code_map codes = table.build_code_map();
    REQUIRE(codes.size() == 300);
    REQUIRE(codes.begin()->first == Huffman_code{16, 0x0000});
    REQUIRE(codes.rbegin()->first == Huffman_code{16, 299});
}
