#include "cuerpo/music_theory.hpp"

#include <algorithm>

namespace cuerpo {
namespace music {

int degree_to_note(int degree, int base) {
    if (degree < 0) degree = 0;
    int octave = degree / kScaleLength;
    return base + octave * 12 + kMajorScale[degree % kScaleLength];
}

std::array<int, 3> triad(int root_degree) {
    return {degree_to_note(root_degree),
            degree_to_note(root_degree + 2),
            degree_to_note(root_degree + 4)};
}

int sixth_of(int root_degree) {
    return degree_to_note(root_degree + 5);
}

int seventh_of(int root_degree) {
    return degree_to_note(root_degree + 6);
}

int hand_y_to_note(float hand_y, int base) {
    int step = static_cast<int>(hand_y * 7.99f);
    step = std::max(0, std::min(7, step));
    // Top step is the octave
    return degree_to_note(step, base);
}

} // namespace music
} // namespace cuerpo
