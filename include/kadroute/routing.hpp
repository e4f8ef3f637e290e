#ifndef _KADROUTE_ROUTING_HPP
#define _KADROUTE_ROUTING_HPP

#include "util.hpp"
#include "contact.hpp"
#include "bucket.hpp"

namespace kadroute {
namespace dht {

/// @brief k-buckets indexed by log2 distance from our own id.
///
/// Not synchronized. Owners that share one table between threads go through
/// shared_routing_table instead.
class routing_table {
public:
    explicit routing_table(hash_t, std::size_t = proto::bucket_size);

    hash_t local_id() const;
    std::size_t bucket_size() const;

    /// @brief record that a peer was just seen alive
    /// @return least recently seen member of the peer's bucket if that bucket is over capacity.
    /// it is not removed; ping it and call remove() if it doesn't answer
    boost::optional<contact> touch(const contact&);

    /// @brief remove an exact (id, address) match
    boost::optional<contact> remove(const contact&);

    /// @brief remove every contact bound to the address, whatever its id
    void remove_address(const net_addr&);

    /// @brief drop empty buckets
    void cleanup();

    bool contains(const contact&) const;
    bool conflicts(const contact&) const;
    boost::optional<contact> find(const hash_t&) const;

    /// @brief up to min(limit, bucket_size) contacts ordered by distance to target,
    /// never including the target itself
    std::vector<contact> closest_contacts(const hash_t&, std::size_t) const;

    std::vector<std::size_t> distances() const;
    std::vector<contact> contacts_at(std::size_t) const;

    std::size_t size() const;

private:
    bucket& add_bucket(std::size_t);
    const bucket* find_bucket(std::size_t) const;
    bucket* find_bucket(std::size_t);

    hash_t id;
    std::size_t max_bucket_size;

    // slot i holds the bucket for distance i. slot 0 would be ourselves and stays empty
    std::array<boost::optional<bucket>, proto::bit_hash_width + 1> buckets;
};

}
}

#endif
