// -------------------------------------------------------------------------------------------------
//
// Copyright (C) all of the contributors. All rights reserved.
//
// This software, including documentation, is protected by copyright controlled by
// contributors. All rights are reserved. Copying, including reproducing, storing,
// adapting or translating, any or all of this material requires the prior written
// consent of all contributors.
//
// -------------------------------------------------------------------------------------------------

#include "edit_distance.h"
#include <utility>

namespace {

struct cell {
    size_t cost = 0;
    size_t subs = 0;
    size_t ins = 0;
    size_t dels = 0;
};

} // namespace

alignment_result edit_distance::align(const std::vector<std::string>& reference,
                                      const std::vector<std::string>& hypothesis) {
    const size_t m = reference.size();
    const size_t n = hypothesis.size();

    // Row 0: turning an empty reference prefix into hyp[0..j) takes j insertions
    std::vector<cell> prev(n + 1);
    std::vector<cell> curr(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prev[j].cost = j;
        prev[j].ins = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = cell{i, 0, 0, i};

        for (size_t j = 1; j <= n; ++j) {
            if (reference[i - 1] == hypothesis[j - 1]) {
                curr[j] = prev[j - 1];
                continue;
            }

            const size_t sub_cost = prev[j - 1].cost + 1;
            const size_t del_cost = prev[j].cost + 1;
            const size_t ins_cost = curr[j - 1].cost + 1;

            if (sub_cost <= del_cost && sub_cost <= ins_cost) {
                curr[j] = prev[j - 1];
                curr[j].subs++;
            } else if (del_cost <= ins_cost) {
                curr[j] = prev[j];
                curr[j].dels++;
            } else {
                curr[j] = curr[j - 1];
                curr[j].ins++;
            }
            curr[j].cost = curr[j].subs + curr[j].ins + curr[j].dels;
        }

        std::swap(prev, curr);
    }

    alignment_result result;
    result.substitutions = prev[n].subs;
    result.insertions = prev[n].ins;
    result.deletions = prev[n].dels;
    result.reference_length = m;
    result.hypothesis_length = n;
    return result;
}

size_t edit_distance::distance(const std::vector<std::string>& reference,
                               const std::vector<std::string>& hypothesis) {
    return align(reference, hypothesis).errors();
}
