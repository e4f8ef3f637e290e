#include "routing.hpp"

using namespace kadroute;
using namespace kadroute::dht;

static void usage() {
    spdlog::error("usage: kadroute ring <count> <bucket_size> <target>");
    spdlog::error("       kadroute names <local-name> <name>...");
}

static void print_layout(const routing_table& table) {
    spdlog::info("table: {} node(s) in {} bucket(s)", table.size(), table.distances().size());

    for(auto d : table.distances()) {
        spdlog::info("distance {}:", d);
        for(const auto& c : table.contacts_at(d))
            spdlog::info("\t{}", c.to_string());
    }
}

// local id 0, everyone else at 1 .. count-1
static int ring(int argc, char** argv) {
    if(argc < 5) {
        usage();
        return 1;
    }

    int count = std::stoi(argv[2]);
    std::size_t bucket_size = std::stoul(argv[3]);
    hash_t target(std::stoul(argv[4]));

    routing_table table(hash_t(0), bucket_size);

    for(int i = 1; i < count; i++) {
        auto candidate = table.touch(contact(hash_t(i), net_addr("127.0.0.1", 4000 + i)));
        if(candidate)
            spdlog::info("eviction candidate after touching {}: {}", i, candidate->to_string());
    }

    print_layout(table);

    spdlog::info("closest to {}:", util::enc58(target));
    for(const auto& c : table.closest_contacts(target, bucket_size))
        spdlog::info("\t{} (distance {})", c.to_string(), c.log2_distance(target));

    return 0;
}

// ids are sha256(name)
static int names(int argc, char** argv) {
    if(argc < 4) {
        usage();
        return 1;
    }

    routing_table table(util::hash(argv[2]));
    spdlog::info("local id: {}", util::to_hex(table.local_id()));

    for(int i = 3; i < argc; i++) {
        contact c(util::hash(argv[i]), net_addr("127.0.0.1", 4000 + i));
        auto candidate = table.touch(c);

        spdlog::info("{} -> {} (distance {})", argv[i], util::enc58(c.id), c.log2_distance(table.local_id()));
        if(candidate)
            spdlog::info("eviction candidate: {}", candidate->to_string());
    }

    print_layout(table);

    return 0;
}

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%P] [%H:%M:%S] [%^%l%$] %v");

    if(argc < 2) {
        usage();
        return 1;
    }

    try {
        std::string mode(argv[1]);

        if(mode == "ring")
            return ring(argc, argv);
        else if(mode == "names")
            return names(argc, argv);

        usage();
    } catch(const std::exception& e) {
        spdlog::error("kadroute: {}", e.what());
    }

    return 1;
}
