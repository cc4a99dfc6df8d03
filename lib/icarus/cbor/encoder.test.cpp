/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <icarus/cbor/decoder.hpp>
#include <icarus/cbor/encoder.hpp>
#include <icarus/common/test.hpp>

using namespace icarus;

suite cbor_encoder_suite = [] {
    "cbor::encoder"_test = [] {
        "simple"_test = [] {
            test_same(uint8_vector::from_hex("F4"), cbor::encode(false));
            test_same(uint8_vector::from_hex("F5"), cbor::encode(true));
            test_same(uint8_vector::from_hex("F6"), cbor::encode(cbor::simple::s_null));
            test_same(uint8_vector::from_hex("F7"), cbor::encode(cbor::simple::s_undefined));
            test_same(uint8_vector::from_hex("F7"), cbor::encode(cbor::value {}));
            expect_throws_msg<cbor::encoding_error>([] { cbor::encode(cbor::simple::s_break); }, "Unrecognized simple value: 31");
            expect_throws_msg<cbor::encoding_error>([] { cbor::encode(cbor::array { 1, cbor::simple::s_break }); }, "Unrecognized simple value: 31");
        };
        "uint"_test = [] {
            test_same(uint8_vector::from_hex("00"), cbor::encode(0));
            test_same(uint8_vector::from_hex("17"), cbor::encode(23));
            test_same(uint8_vector::from_hex("1818"), cbor::encode(24));
            test_same(uint8_vector::from_hex("18FF"), cbor::encode(255));
            test_same(uint8_vector::from_hex("190100"), cbor::encode(256));
            test_same(uint8_vector::from_hex("19FFFF"), cbor::encode(0xFFFF));
            test_same(uint8_vector::from_hex("1AFFFFFFFF"), cbor::encode(0xFFFFFFFF));
            test_same(uint8_vector::from_hex("1B000000FFFFFFFFFF"), cbor::encode(0xFFFFFFFFFF));
            test_same(uint8_vector::from_hex("1B001FFFFFFFFFFFFF"), cbor::encode(max_safe_integer));
            test_same(uint8_vector::from_hex("1B0020000000000000"), cbor::encode(max_safe_integer + 1));
            test_same(uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"), cbor::encode(std::numeric_limits<uint64_t>::max()));
        };
        "nint"_test = [] {
            test_same(uint8_vector::from_hex("20"), cbor::encode(-1));
            test_same(uint8_vector::from_hex("37"), cbor::encode(-24));
            test_same(uint8_vector::from_hex("3818"), cbor::encode(-25));
            test_same(uint8_vector::from_hex("38FF"), cbor::encode(-256));
            test_same(uint8_vector::from_hex("390100"), cbor::encode(-257));
            test_same(uint8_vector::from_hex("3B001FFFFFFFFFFFFE"), cbor::encode(-max_safe_integer));
            test_same(uint8_vector::from_hex("3B7FFFFFFFFFFFFFFF"), cbor::encode(std::numeric_limits<int64_t>::min()));
            test_same(uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"), cbor::encode(cbor::value::from_nint(std::numeric_limits<uint64_t>::max())));
        };
        "too large"_test = [] {
            cpp_int too_big { 1 };
            too_big <<= 64;
            expect_throws_msg<cbor::encoding_error>([&] { cbor::encode(too_big); }, "Value too large to encode: 18446744073709551616");
            cpp_int too_small = -too_big;
            too_small -= 1;
            expect_throws_msg<cbor::encoding_error>([&] { cbor::encode(too_small); }, "Value too large to encode: 18446744073709551616");
            cpp_int smallest = -too_big;
            test_same(uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"), cbor::encode(smallest));
        };
        "text"_test = [] {
            test_same(uint8_vector::from_hex("60"), cbor::encode(""));
            test_same(uint8_vector::from_hex("6161"), cbor::encode("a"));
            test_same(uint8_vector::from_hex("62C3BC"), cbor::encode("\xC3\xBC"));
            test_same(uint8_vector::from_hex("64F0908591"), cbor::encode("\xF0\x90\x85\x91"));
            const std::string long_text(300, 'x');
            const auto enc = cbor::encode(long_text);
            test_same(size_t { 303 }, enc.size());
            test_same(uint8_vector::from_hex("79012C"), uint8_vector { buffer { enc }.subbuf(0, 3) });
        };
        "bytes"_test = [] {
            test_same(uint8_vector::from_hex("40"), cbor::encode(cbor::bytes {}));
            test_same(uint8_vector::from_hex("43010203"), cbor::encode(cbor::bytes { 1, 2, 3 }));
        };
        "arrays"_test = [] {
            test_same(uint8_vector::from_hex("80"), cbor::encode(cbor::array {}));
            test_same(uint8_vector::from_hex("83010203"), cbor::encode(cbor::array { 1, 2, 3 }));
            test_same(uint8_vector::from_hex("8301820203820405"), cbor::encode(cbor::array { 1, cbor::array { 2, 3 }, cbor::array { 4, 5 } }));
            test_same(uint8_vector::from_hex("826161A161626163"), cbor::encode(cbor::array { "a", cbor::map { { "b", "c" } } }));
        };
        "maps keep insertion order"_test = [] {
            test_same(uint8_vector::from_hex("A0"), cbor::encode(cbor::map {}));
            test_same(uint8_vector::from_hex("A2613102613304"), cbor::encode(cbor::map { { "1", 2 }, { "3", 4 } }));
            test_same(uint8_vector::from_hex("A2616201616102"), cbor::encode(cbor::map { { "b", 1 }, { "a", 2 } }));
        };
        "kitchen sink"_test = [] {
            const cbor::value v { cbor::array {
                1, "a", cbor::value {}, cbor::map { { "a", 1 }, { "2", "b" } }, false,
                cbor::array { 1, "b", 3 }, true, cbor::simple::s_null, cbor::array { "a", 2, "c" }
            } };
            test_same(uint8_vector::from_hex("89016161F7A261610161326162F48301616203F5F6836161026163"), cbor::encode(v));
        };
        "self-described"_test = [] {
            test_same(uint8_vector::from_hex("D9D9F743010203"), cbor::encode_with_self_described_tag(cbor::bytes { 1, 2, 3 }));
            test_same(uint8_vector::from_hex("D9D9F7F5"), cbor::encode_with_self_described_tag(true));
        };
        "encoder"_test = [] {
            cbor::encoder enc {};
            enc.self_described_tag().value(1).value("a");
            test_same(size_t { 6 }, enc.size());
            test_same(uint8_vector::from_hex("D9D9F7016161"), enc.cbor());
        };
        "large outputs"_test = [] {
            const cbor::bytes blob(5000);
            const auto enc = cbor::encode(blob);
            test_same(size_t { 5003 }, enc.size());
            test_same(uint8_vector::from_hex("591388"), uint8_vector { buffer { enc }.subbuf(0, 3) });

            cbor::array items {};
            for (int64_t i = 0; i < 3000; ++i)
                items.emplace_back(i * 1000);
            const cbor::value v { items };
            const auto enc_default = cbor::encode(v);
            const auto enc_small = cbor::encode(v, {}, cbor::encode_options { .initial_capacity = 16, .safe_margin = 9 });
            test_same(enc_default, enc_small);
            test_same(v, cbor::decode(enc_default));
        };
        "invalid options"_test = [] {
            expect_throws_msg([] { cbor::encode(1, {}, cbor::encode_options { .initial_capacity = 10, .safe_margin = 10 }); },
                "the initial capacity of an output region: 10 must be larger than its safe margin: 10");
        };
    };
};
