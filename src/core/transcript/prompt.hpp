#pragma once

#include "../detector/audio_analysis.hpp"

#include <string>

// Instruction text sent with the audio. Embeds the measured durations so the
// engine can calibrate how conservative to be.
std::string build_prompt(const AudioAnalysis& analysis);
