#ifndef WIREDOC_RIFFLE_SHUFFLER_H
#define WIREDOC_RIFFLE_SHUFFLER_H

#include <cstddef>
#include <vector>

namespace WireDoc {

// Position of one element of the interleaved sequence
struct RifflePosition {
    size_t track = 0;   // index of the track in declared order
    size_t index = 0;   // index within the track
};

// Interleave order for tracks of the given lengths: one element from each
// non-exhausted track per round, in track order. Exhausted tracks drop out;
// nothing is padded. Output size is the sum of the lengths.
std::vector<RifflePosition> riffle_order(const std::vector<size_t>& track_lengths);

template <typename T>
std::vector<T> riffle_shuffle(const std::vector<std::vector<T>>& tracks) {
    std::vector<size_t> lengths;
    lengths.reserve(tracks.size());
    for (const auto& t : tracks) lengths.push_back(t.size());

    std::vector<T> out;
    for (const auto& pos : riffle_order(lengths)) {
        out.push_back(tracks[pos.track][pos.index]);
    }
    return out;
}

} // namespace WireDoc

#endif // WIREDOC_RIFFLE_SHUFFLER_H
