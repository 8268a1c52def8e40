#pragma once
// Builds the "essentials" index: a five-field summary of every problem,
// sorted by id so the stored value is the same whatever the input row order.
// last_updated is left unset; the pipeline stamps it right before upload.
#include <vector>
#include "problem_record.hpp"

namespace kvload {

EssentialEntry summarize(const Problem& p);

EssentialsIndex build_essentials(const std::vector<Problem>& problems);

} // namespace kvload
