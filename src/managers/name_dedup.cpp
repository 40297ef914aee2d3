#include "name_dedup.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <map>
#include <set>
#include <string>

size_t deduplicate_names(std::vector<FileRecord>& records) {
    // Group by name, keeping first-seen order of groups and members
    std::map<std::string, std::vector<size_t>> groups;
    std::vector<std::string> order;
    std::set<std::string> taken;
    for (size_t i = 0; i < records.size(); ++i) {
        auto& members = groups[records[i].computed_name];
        if (members.empty()) order.push_back(records[i].computed_name);
        members.push_back(i);
        taken.insert(records[i].computed_name);
    }

    size_t renamed = 0;
    for (const auto& name : order) {
        const auto& members = groups[name];
        if (members.size() <= 1) continue;

        size_t counter = 0;
        for (size_t idx : members) {
            std::string candidate;
            do {
                ++counter;
                candidate = fmt::format("{}_{}", counter, name);
            } while (taken.count(candidate) > 0);

            taken.insert(candidate);
            log_debug(fmt::format("Renamed duplicate {} -> {} ({})",
                                  name, candidate, records[idx].full_path.string()));
            records[idx].computed_name = std::move(candidate);
            ++renamed;
        }
    }
    return renamed;
}
