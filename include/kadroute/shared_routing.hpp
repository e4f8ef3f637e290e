#ifndef _KADROUTE_SHARED_ROUTING_HPP
#define _KADROUTE_SHARED_ROUTING_HPP

#include "util.hpp"
#include "routing.hpp"

namespace kadroute {
namespace dht {

/// @brief routing_table behind a reader/writer lock, for owners that reach
/// one table from several threads
class shared_routing_table {
public:
    explicit shared_routing_table(hash_t, std::size_t = proto::bucket_size);

    hash_t local_id() const;

    // writers
    boost::optional<contact> touch(const contact&);
    boost::optional<contact> remove(const contact&);
    void remove_address(const net_addr&);
    void cleanup();

    /// @brief run fn against the table under the write lock, e.g. to re-check an
    /// eviction candidate and remove it as one step
    void apply(const std::function<void(routing_table&)>&);

    // readers
    bool contains(const contact&) const;
    bool conflicts(const contact&) const;
    boost::optional<contact> find(const hash_t&) const;
    std::vector<contact> closest_contacts(const hash_t&, std::size_t) const;
    std::vector<std::size_t> distances() const;
    std::vector<contact> contacts_at(std::size_t) const;
    std::size_t size() const;

private:
    routing_table table;
    mutable boost::shared_mutex mutex;
};

}
}

#endif
