#include "wiredoc/riffle_shuffler.h"

namespace WireDoc {

std::vector<RifflePosition> riffle_order(const std::vector<size_t>& track_lengths) {
    size_t total = 0;
    size_t rounds = 0;
    for (size_t len : track_lengths) {
        total += len;
        if (len > rounds) rounds = len;
    }

    std::vector<RifflePosition> order;
    order.reserve(total);

    // Cursor r is shared by all tracks: round r takes element r of every
    // track that still has one
    for (size_t r = 0; r < rounds; ++r) {
        for (size_t t = 0; t < track_lengths.size(); ++t) {
            if (r < track_lengths[t]) {
                order.push_back(RifflePosition{t, r});
            }
        }
    }

    return order;
}

} // namespace WireDoc
