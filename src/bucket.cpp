#include "bucket.hpp"

namespace kadroute {
namespace dht {

bucket::bucket(std::size_t max_size_) : max_size(max_size_) { }

// called whenever a peer was seen alive.
// if it exists, move to back
// if it doesn't exist and its id is free, add to back
// if its id is bound to another address, keep the old binding and drop this one
boost::optional<contact> bucket::touch(const contact& c) {
    auto it = std::find(begin(), end(), c);

    if(it != end()) {
        splice(end(), *this, it);
        spdlog::debug("routing: exists already, moved node {} to tail. size: {}", util::enc58(c.id), size());
    } else if(conflicts(c)) {
        spdlog::debug("routing: node {} is already bound to another address, ignoring {}",
            util::enc58(c.id), c.addr.to_string());
    } else {
        push_back(c);
        spdlog::debug("routing: new node (id: {}, addr: {}), size: {}", util::enc58(c.id), c.addr.to_string(), size());
    }

    return head_if_full();
}

boost::optional<contact> bucket::remove(const contact& c) {
    auto it = std::find(begin(), end(), c);

    if(it != end()) {
        erase(it);
        spdlog::debug("routing: removed node {} ({}), size: {}", util::enc58(c.id), c.addr.to_string(), size());
    }

    return head_if_full();
}

void bucket::remove_address(const net_addr& addr) {
    remove_if([&](const contact& c) { return c.addr == addr; });
}

bool bucket::contains(const contact& c) const {
    return std::find(begin(), end(), c) != end();
}

bool bucket::conflicts(const contact& c) const {
    return std::any_of(begin(), end(),
        [&](const contact& e) { return e.id == c.id && e.addr != c.addr; });
}

boost::optional<contact> bucket::find(const hash_t& id) const {
    auto it = std::find_if(begin(), end(),
        [&](const contact& e) { return e.id == id; });

    return (it != end()) ? *it : boost::optional<contact>(boost::none);
}

// the oldest entry is only handed back, the caller has to check it and remove it
boost::optional<contact> bucket::head_if_full() const {
    if(size() > max_size) {
        spdlog::debug("routing: bucket over capacity ({} > {}), eviction candidate {}",
            size(), max_size, util::enc58(front().id));
        return front();
    }

    return boost::none;
}

}
}
