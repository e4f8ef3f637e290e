#include "contact.hpp"

namespace kadroute {
namespace dht {

std::size_t log2_distance(const hash_t& a, const hash_t& b) {
    hash_t d = a ^ b;

    if(d == 0)
        return 0;

    return boost::multiprecision::msb(d) + 1;
}

bool contact::operator<(const contact& rhs) const {
    if(id != rhs.id)
        return id < rhs.id;

    return addr < rhs.addr;
}

std::string contact::to_string() const {
    return fmt::format("{}@{}", util::enc58(id), addr.to_string());
}

contact_with_distance::contact_with_distance(const dht::contact& c, const hash_t& target) :
    distance(c.log2_distance(target)), contact(c) { }

bool contact_with_distance::operator<(const contact_with_distance& rhs) const {
    if(distance != rhs.distance)
        return distance < rhs.distance;

    return contact < rhs.contact;
}

}
}
