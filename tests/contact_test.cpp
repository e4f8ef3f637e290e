#include "catch2/catch_all.hpp"

#include "contact.hpp"

using namespace kadroute;
using namespace kadroute::dht;

TEST_CASE("log2 distance is the highest differing bit", "[distance]") {
    REQUIRE(log2_distance(hash_t(0), hash_t(0)) == 0);
    REQUIRE(log2_distance(hash_t(0), hash_t(1)) == 1);
    REQUIRE(log2_distance(hash_t(0), hash_t(2)) == 2);
    REQUIRE(log2_distance(hash_t(0), hash_t(3)) == 2);
    REQUIRE(log2_distance(hash_t(4), hash_t(7)) == 2);
    REQUIRE(log2_distance(hash_t(4), hash_t(8)) == 4);
    REQUIRE(log2_distance(hash_t(17), hash_t(16)) == 1);

    hash_t top = hash_t(1) << (proto::bit_hash_width - 1);
    REQUIRE(log2_distance(top, hash_t(0)) == proto::bit_hash_width);
    REQUIRE(log2_distance(~hash_t(0), ~hash_t(0)) == 0);

    // symmetric
    REQUIRE(log2_distance(hash_t(9), hash_t(100)) == log2_distance(hash_t(100), hash_t(9)));
}

TEST_CASE("contacts compare by id then address", "[contact]") {
    contact a(hash_t(1), net_addr("10.0.0.2", 80));
    contact b(hash_t(1), net_addr("10.0.0.10", 80));
    contact c(hash_t(2), net_addr("10.0.0.1", 80));

    REQUIRE(a != b);
    REQUIRE(a == contact(hash_t(1), net_addr("10.0.0.2", 80)));

    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(!(c < a));

    REQUIRE(net_addr("10.0.0.1", 80) < net_addr("10.0.0.1", 81));
    REQUIRE(net_addr("255.255.255.255", 80) < net_addr("::1", 80));
}

TEST_CASE("ranking orders by distance before contact", "[contact]") {
    hash_t target(4);

    contact_with_distance near(contact(hash_t(7), net_addr()), target);
    contact_with_distance far(contact(hash_t(1), net_addr()), target);

    REQUIRE(near.distance == 2);
    REQUIRE(far.distance == 3);
    REQUIRE(near < far);
    REQUIRE(!(far < near));

    contact_with_distance tie(contact(hash_t(6), net_addr()), target);
    REQUIRE(tie < near);
}

TEST_CASE("addresses print as ip:port", "[contact]") {
    REQUIRE(net_addr("127.0.0.1", 4000).to_string() == "127.0.0.1:4000");
    REQUIRE(net_addr("::1", 4000).to_string() == "[::1]:4000");
    REQUIRE(contact(hash_t(0), net_addr("127.0.0.1", 1)).to_string() == "1@127.0.0.1:1");

    net_addr a("192.168.0.3", 53);
    REQUIRE(net_addr(a.udp_endpoint()) == a);

    REQUIRE_THROWS(net_addr("not an address", 1));
}

TEST_CASE("base58 ids", "[util]") {
    REQUIRE(util::enc58(hash_t(0)) == "1");
    REQUIRE(util::enc58(hash_t(57)) == "z");
    REQUIRE(util::enc58(hash_t(58)) == "21");
    REQUIRE(util::dec58("21") == hash_t(58));

    hash_t h = util::hash("some node");
    REQUIRE(util::dec58(util::enc58(h)) == h);

    REQUIRE_THROWS_AS(util::dec58("0OIl"), std::runtime_error);
}

TEST_CASE("hex ids", "[util]") {
    REQUIRE(util::from_hex("0x11") == hash_t(17));
    REQUIRE(util::from_hex("000000000000000000000000000000000000000000000000000000000000000a") == hash_t(10));
    REQUIRE(util::to_hex(hash_t(10)) == "000000000000000000000000000000000000000000000000000000000000000a");

    REQUIRE_THROWS_AS(util::from_hex(""), std::runtime_error);
    REQUIRE_THROWS_AS(util::from_hex("xyz"), std::runtime_error);
    REQUIRE_THROWS_AS(util::from_hex(std::string(65, 'f')), std::runtime_error);
}

TEST_CASE("ids are sha256 digests", "[util]") {
    REQUIRE(util::to_hex(util::hash("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(util::hash("abc") != util::hash("abd"));
}
