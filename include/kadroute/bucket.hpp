#ifndef _KADROUTE_BUCKET_HPP
#define _KADROUTE_BUCKET_HPP

#include "util.hpp"
#include "contact.hpp"

namespace kadroute {
namespace dht {

// contacts of one distance class. front is the least recently seen, back the most recently seen
class bucket : public std::list<contact> {
public:
    explicit bucket(std::size_t);

    boost::optional<contact> touch(const contact&);
    boost::optional<contact> remove(const contact&);
    void remove_address(const net_addr&);

    bool contains(const contact&) const;
    bool conflicts(const contact&) const;
    boost::optional<contact> find(const hash_t&) const;

    boost::optional<contact> head_if_full() const;

    std::size_t max_size;
};

}
}

#endif
