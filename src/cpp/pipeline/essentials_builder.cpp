#include "essentials_builder.hpp"
#include <algorithm>

namespace kvload {

EssentialEntry summarize(const Problem& p) {
    EssentialEntry e;
    e.id = p.id;
    e.title = p.title;
    e.difficulty = p.difficulty;
    e.category = p.metadata.category;
    e.topics = p.metadata.topics;
    return e;
}

EssentialsIndex build_essentials(const std::vector<Problem>& problems) {
    EssentialsIndex index;
    index.problems.reserve(problems.size());
    for (const auto& p : problems) {
        index.problems.push_back(summarize(p));
    }

    std::stable_sort(index.problems.begin(), index.problems.end(),
        [](const EssentialEntry& a, const EssentialEntry& b) { return a.id < b.id; });

    index.count = index.problems.size();
    return index;
}

} // namespace kvload
