#ifndef _KADROUTE_UTIL_HPP
#define _KADROUTE_UTIL_HPP

#include <stdexcept>
#include <utility>
#include <string>
#include <list>
#include <set>
#include <vector>
#include <array>
#include <deque>
#include <memory>
#include <algorithm>
#include <functional>
#include <cstdint>
#include <cstring>
#include <cctype>
#include <ios>
#include <tuple>
#include <iterator>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/optional.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/locks.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include "spdlog/spdlog.h"
#include "cryptopp/sha.h"
#include "cryptopp/hex.h"
#include "cryptopp/filters.h"

#define R_LOCK(m) boost::shared_lock<boost::shared_mutex> read_lock(m);
#define W_LOCK(m) boost::unique_lock<boost::shared_mutex> write_lock(m);

namespace kadroute {

typedef std::uint64_t u64;
typedef std::uint32_t u32;
typedef std::uint16_t u16;
typedef std::uint8_t u8;

using boost::asio::ip::udp;

namespace dht {

namespace proto {

const std::size_t bucket_size = 20; // number of entries in k-buckets (k=20)
const std::size_t bit_hash_width = 256; // hash width in bits
const std::size_t alpha = 3; // alpha from kademlia paper
}

typedef boost::multiprecision::number<
    boost::multiprecision::cpp_int_backend<
        proto::bit_hash_width,
        proto::bit_hash_width,
        boost::multiprecision::unsigned_magnitude,
        boost::multiprecision::unchecked,
        void>,
    boost::multiprecision::et_off> hash_t;

struct net_addr {
    boost::asio::ip::address ip;
    u16 port;

    net_addr() : ip(), port(0) { }
    net_addr(const std::string& a, u16 p) : ip(boost::asio::ip::make_address(a)), port(p) { }
    net_addr(const boost::asio::ip::address& a, u16 p) : ip(a), port(p) { }
    explicit net_addr(const udp::endpoint& e) : ip(e.address()), port(e.port()) { }

    udp::endpoint udp_endpoint() const {
        return udp::endpoint{ ip, port };
    }

    bool operator==(const net_addr& rhs) const {
        return ip == rhs.ip && port == rhs.port;
    }

    bool operator!=(const net_addr& rhs) const {
        return !(*this == rhs);
    }

    // v4 before v6, then numeric address, then port
    bool operator<(const net_addr& rhs) const {
        return std::tie(ip, port) < std::tie(rhs.ip, rhs.port);
    }

    std::string to_string() const {
        if(ip.is_v6())
            return fmt::format("[{}]:{}", ip.to_string(), port);
        return fmt::format("{}:{}", ip.to_string(), port);
    }
};

namespace util { // utilities

// most of the base58 code is taken from https://learnmeabitcoin.com/technical/base58

static const char b58map[] = {
  '1', '2', '3', '4', '5', '6', '7', '8',
  '9', 'A', 'B', 'C', 'D', 'E', 'F', 'G',
  'H', 'J', 'K', 'L', 'M', 'N', 'P', 'Q',
  'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y',
  'Z', 'a', 'b', 'c', 'd', 'e', 'f', 'g',
  'h', 'i', 'j', 'k', 'm', 'n', 'o', 'p',
  'q', 'r', 's', 't', 'u', 'v', 'w', 'x',
  'y', 'z', '\0' };

// encode hash into base58, used when logging ids
static std::string enc58(hash_t h) {
    if(h == 0)
        return std::string(1, b58map[0]);

    std::deque<char> result;
    while(h > 0) {
        int remainder = (h % 58).convert_to<int>();
        result.push_front(b58map[remainder]);
        h /= 58;
    }

    return std::string(result.begin(), result.end());
}

// decode base58 into hash
static hash_t dec58(const std::string& s) {
    hash_t result = 0;

    for(std::size_t i = 0; i != s.size(); i++) {
        const char* p = s[i] == '\0' ? NULL : std::strchr(b58map, s[i]);
        if(p == NULL)
            throw std::runtime_error("invalid base58 character");

        result = result * 58 + (p - b58map);
    }

    return result;
}

// parse a big-endian hex string (optionally 0x-prefixed) into a hash
static hash_t from_hex(const std::string& s) {
    std::string digits = s.compare(0, 2, "0x") == 0 ? s.substr(2) : s;

    if(digits.empty() || digits.size() > proto::bit_hash_width / 4)
        throw std::runtime_error("invalid hex id length");

    if(!std::all_of(digits.begin(), digits.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); }))
        throw std::runtime_error("invalid hex character");

    return hash_t("0x" + digits);
}

// zero-padded lowercase hex, bit_hash_width / 4 characters
static std::string to_hex(const hash_t& h) {
    std::string s = h.str(0, std::ios_base::hex);
    std::transform(s.begin(), s.end(), s.begin(), [](char c) { return static_cast<char>(std::tolower(c)); });
    return std::string(proto::bit_hash_width / 4 - s.size(), '0') + s;
}

// node ids are derived from a sha256 digest of some stable node material (e.g. a public key)
static hash_t hash(const std::string& s) {
    std::string digest, hex;
    CryptoPP::SHA256 h;

    h.Update(reinterpret_cast<const CryptoPP::byte*>(s.data()), s.size());
    digest.resize(h.DigestSize());
    h.Final(reinterpret_cast<CryptoPP::byte*>(&digest[0]));

    CryptoPP::StringSource(digest, true,
        new CryptoPP::HexEncoder(new CryptoPP::StringSink(hex)));

    return hash_t("0x" + hex);
}

}

}
}

#endif
