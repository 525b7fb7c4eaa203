#include <doctest/doctest.h>
#include <psd/fourcc.hh>
#include <psd/keys.hh>

#include <sstream>
#include <unordered_map>
#include <set>

using namespace psd;

TEST_SUITE("FOURCC") {
    TEST_CASE("fourcc construction") {
        SUBCASE("default construction") {
            fourcc f;
            CHECK(f.to_string() == "    ");
        }

        SUBCASE("individual char construction") {
            fourcc key('L', 'a', 'y', 'r');
            CHECK(key.to_string() == "Layr");
            CHECK(key[0] == 'L');
            CHECK(key[3] == 'r');
        }

        SUBCASE("string_view construction with padding") {
            fourcc mul(std::string_view("mul"));
            CHECK(mul.to_string() == "mul ");

            fourcc toolong(std::string_view("TOOLONG"));
            CHECK(toolong.to_string() == "TOOL");
        }

        SUBCASE("from_bytes construction") {
            unsigned char data[4] = {0x01, '8', 'B', 0x7F};
            fourcc bin = fourcc::from_bytes(data);
            CHECK(bin[0] == 0x01);
            CHECK(bin[1] == '8');
            CHECK(bin[3] == 0x7F);
            CHECK_FALSE(bin.is_printable());
        }
    }

    TEST_CASE("fourcc literals and key constants") {
        constexpr auto layr = "Layr"_4cc;
        CHECK(layr == keys::LAYER);
        CHECK("mul"_4cc == blend_mode::MULTIPLY);
        CHECK(keys::USER_MASK.to_string() == "LMsk");
    }

    TEST_CASE("fourcc big-endian interpretation") {
        CHECK("8BIM"_4cc.to_uint32() == 0x3842494Du);
        CHECK("Layr"_4cc.to_uint32() == 0x4C617972u);
    }

    TEST_CASE("fourcc reversal") {
        SUBCASE("little-endian signatures") {
            CHECK("8BIM"_4cc.reversed() == "MIB8"_4cc);
            CHECK("8B64"_4cc.reversed() == "46B8"_4cc);
        }

        SUBCASE("reversal is an involution") {
            auto key = "Lr16"_4cc;
            CHECK(key.reversed().to_string() == "61rL");
            CHECK(key.reversed().reversed() == key);
        }
    }

    TEST_CASE("fourcc comparison and hashing") {
        CHECK("Layr"_4cc != "Lr16"_4cc);
        CHECK("Lr16"_4cc < "Lr32"_4cc);

        std::set<fourcc> ordered{"lyid"_4cc, "Layr"_4cc, "LMsk"_4cc};
        CHECK(ordered.begin()->to_string() == "LMsk");

        std::unordered_map<fourcc, int> counts;
        counts["luni"_4cc] = 1;
        counts["luni"_4cc]++;
        counts["lyid"_4cc] = 5;
        CHECK(counts.size() == 2);
        CHECK(counts["luni"_4cc] == 2);
    }

    TEST_CASE("fourcc output") {
        std::ostringstream os;
        os << "Txt2"_4cc;
        CHECK(os.str() == "'Txt2'");

        std::ostringstream escaped;
        escaped << fourcc('a', '\x01', 'b', ' ');
        CHECK(escaped.str() == "'a\\x01b '");
    }
}
