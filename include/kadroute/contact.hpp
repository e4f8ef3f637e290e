#ifndef _KADROUTE_CONTACT_HPP
#define _KADROUTE_CONTACT_HPP

#include "util.hpp"

namespace kadroute {
namespace dht {

/// @brief 1-based index of the highest differing bit of two ids, 0 if they are equal
std::size_t log2_distance(const hash_t&, const hash_t&);

// a peer as the routing table knows it: one id bound to one address
struct contact {
    hash_t id;
    net_addr addr;

    contact() : id(0), addr() { }
    contact(hash_t id_, const net_addr& addr_) : id(id_), addr(addr_) { }

    std::size_t log2_distance(const hash_t& other) const {
        return dht::log2_distance(id, other);
    }

    bool operator==(const contact& rhs) const { return id == rhs.id && addr == rhs.addr; }
    bool operator!=(const contact& rhs) const { return !(*this == rhs); }
    bool operator<(const contact& rhs) const;

    std::string to_string() const;
};

// ranking entry for closest-contact queries. distance is relative to the query target
struct contact_with_distance {
    std::size_t distance;
    dht::contact contact;

    contact_with_distance(const dht::contact&, const hash_t&);

    bool operator<(const contact_with_distance&) const;
};

}
}

#endif
