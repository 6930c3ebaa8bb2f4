#pragma once

#include "detector/audio_analysis.hpp"
#include "pipeline.hpp"
#include "transcript/transcript_entry.hpp"

#include <cstdio>
#include <string>

// Human-readable console output. Nothing downstream parses these lines.

std::string format_analysis(const AudioAnalysis& analysis);

// "[00:01] Speaker 1: hello [confidence: 0.95]"
std::string format_entry(const TranscriptEntry& entry);

// "[FILTERED] Low confidence (0.55): [00:01] Speaker 1: hello"
std::string format_rejection(const RejectionRecord& rejection);

std::string format_confidence(const std::optional<double>& confidence);

void print_report(std::FILE* out, const PipelineResult& result);
