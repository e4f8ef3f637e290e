#include "routing.hpp"
#include "util.hpp"

namespace kadroute {
namespace dht {

routing_table::routing_table(hash_t id_, std::size_t bucket_size_) :
    id(id_), max_bucket_size(bucket_size_) { }

hash_t routing_table::local_id() const {
    return id;
}

std::size_t routing_table::bucket_size() const {
    return max_bucket_size;
}

bucket& routing_table::add_bucket(std::size_t distance) {
    if(!buckets[distance]) {
        buckets[distance].emplace(max_bucket_size);
        spdlog::debug("routing: new bucket for distance {}", distance);
    }

    return *buckets[distance];
}

const bucket* routing_table::find_bucket(std::size_t distance) const {
    if(distance == 0 || distance >= buckets.size() || !buckets[distance])
        return nullptr;

    return buckets[distance].get_ptr();
}

bucket* routing_table::find_bucket(std::size_t distance) {
    if(distance == 0 || distance >= buckets.size() || !buckets[distance])
        return nullptr;

    return buckets[distance].get_ptr();
}

/// @brief update peer in routing table whether or not it exists within table
boost::optional<contact> routing_table::touch(const contact& c) {
    std::size_t distance = c.log2_distance(id);

    // our own id is never a peer of ours
    if(distance == 0) {
        spdlog::debug("routing: ignoring touch for own id {} ({})", util::enc58(c.id), c.addr.to_string());
        return boost::none;
    }

    return add_bucket(distance).touch(c);
}

boost::optional<contact> routing_table::remove(const contact& c) {
    bucket* b = find_bucket(c.log2_distance(id));

    if(b == nullptr)
        return boost::none;

    return b->remove(c);
}

void routing_table::remove_address(const net_addr& addr) {
    std::size_t before = size();

    for(auto& b : buckets)
        if(b)
            b->remove_address(addr);

    spdlog::debug("routing: removed {} node(s) bound to {}", before - size(), addr.to_string());
}

void routing_table::cleanup() {
    for(std::size_t d = 1; d < buckets.size(); d++) {
        if(buckets[d] && buckets[d]->empty()) {
            buckets[d] = boost::none;
            spdlog::debug("routing: dropped empty bucket for distance {}", d);
        }
    }
}

bool routing_table::contains(const contact& c) const {
    const bucket* b = find_bucket(c.log2_distance(id));
    return b != nullptr && b->contains(c);
}

bool routing_table::conflicts(const contact& c) const {
    std::size_t distance = c.log2_distance(id);

    if(distance == 0)
        return true;

    const bucket* b = find_bucket(distance);
    return b != nullptr && b->conflicts(c);
}

boost::optional<contact> routing_table::find(const hash_t& target) const {
    const bucket* b = find_bucket(log2_distance(target, id));

    if(b == nullptr)
        return boost::none;

    return b->find(target);
}

std::vector<contact> routing_table::closest_contacts(const hash_t& target, std::size_t limit) const {
    std::set<contact_with_distance> ranked;

    for(const auto& b : buckets) {
        if(!b)
            continue;

        // members past bucket_size are waiting on an eviction check, leave them out
        std::size_t n = 0;
        for(auto e = b->begin(); e != b->end() && n++ < max_bucket_size; ++e) {
            if(e->id == target)
                continue;

            contact_with_distance item(*e, target);

            if(ranked.size() >= max_bucket_size && !(item < *ranked.rbegin()))
                continue;

            ranked.insert(item);

            // keep only the bucket_size best
            if(ranked.size() > max_bucket_size)
                ranked.erase(std::prev(ranked.end()));
        }
    }

    std::vector<contact> res;
    std::size_t count = std::min(limit, max_bucket_size);

    for(auto it = ranked.begin(); it != ranked.end() && res.size() < count; ++it)
        res.push_back(it->contact);

    return res;
}

std::vector<std::size_t> routing_table::distances() const {
    std::vector<std::size_t> res;

    for(std::size_t d = 1; d < buckets.size(); d++)
        if(buckets[d])
            res.push_back(d);

    return res;
}

std::vector<contact> routing_table::contacts_at(std::size_t distance) const {
    const bucket* b = find_bucket(distance);

    if(b == nullptr)
        return {};

    return std::vector<contact>(b->begin(), b->end());
}

std::size_t routing_table::size() const {
    std::size_t n = 0;

    for(const auto& b : buckets)
        if(b)
            n += b->size();

    return n;
}

}
}
