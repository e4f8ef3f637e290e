#include "shared_routing.hpp"

namespace kadroute {
namespace dht {

shared_routing_table::shared_routing_table(hash_t id_, std::size_t bucket_size_) :
    table(id_, bucket_size_) { }

// fixed at construction
hash_t shared_routing_table::local_id() const {
    return table.local_id();
}

boost::optional<contact> shared_routing_table::touch(const contact& c) {
    W_LOCK(mutex);
    return table.touch(c);
}

boost::optional<contact> shared_routing_table::remove(const contact& c) {
    W_LOCK(mutex);
    return table.remove(c);
}

void shared_routing_table::remove_address(const net_addr& addr) {
    W_LOCK(mutex);
    table.remove_address(addr);
}

void shared_routing_table::cleanup() {
    W_LOCK(mutex);
    table.cleanup();
}

void shared_routing_table::apply(const std::function<void(routing_table&)>& fn) {
    W_LOCK(mutex);
    fn(table);
}

bool shared_routing_table::contains(const contact& c) const {
    R_LOCK(mutex);
    return table.contains(c);
}

bool shared_routing_table::conflicts(const contact& c) const {
    R_LOCK(mutex);
    return table.conflicts(c);
}

boost::optional<contact> shared_routing_table::find(const hash_t& id) const {
    R_LOCK(mutex);
    return table.find(id);
}

std::vector<contact> shared_routing_table::closest_contacts(const hash_t& target, std::size_t limit) const {
    R_LOCK(mutex);
    return table.closest_contacts(target, limit);
}

std::vector<std::size_t> shared_routing_table::distances() const {
    R_LOCK(mutex);
    return table.distances();
}

std::vector<contact> shared_routing_table::contacts_at(std::size_t distance) const {
    R_LOCK(mutex);
    return table.contacts_at(distance);
}

std::size_t shared_routing_table::size() const {
    R_LOCK(mutex);
    return table.size();
}

}
}
