#pragma once

#include <array>

namespace cuerpo {
namespace music {

constexpr int kChordBaseNote = 48;       // C3
constexpr int kMelodyRightBase = 48;     // C3, lower octave
constexpr int kMelodyLeftBase = 72;      // C5, upper octave
constexpr int kScaleLength = 7;

// Semitone offsets of the C major scale
constexpr std::array<int, kScaleLength> kMajorScale = {0, 2, 4, 5, 7, 9, 11};

// MIDI note of a scale degree counted from base (degrees past 6 wrap into the next octave)
int degree_to_note(int degree, int base = kChordBaseNote);

// Three notes of the triad rooted on degree
std::array<int, 3> triad(int root_degree);

// Sixth and seventh above the chord root
int sixth_of(int root_degree);
int seventh_of(int root_degree);

// Quantize a [0,1] hand height into eight steps of one octave above base
int hand_y_to_note(float hand_y, int base);

} // namespace music
} // namespace cuerpo
