#include "prompt.hpp"

#include <format>

std::string build_prompt(const AudioAnalysis& analysis) {
    return std::format(R"(You are an expert transcriptionist with strict accuracy requirements.

CRITICAL INSTRUCTIONS:
- ONLY transcribe speech that you can clearly hear in the audio
- DO NOT generate fictional content, conversations, or made-up speech
- If you cannot clearly hear speech, return an empty array []
- DO NOT create timestamps for silence or background noise
- BE EXTREMELY CONSERVATIVE - when in doubt, return empty array

Audio Analysis Context:
- Audio duration: {:.2f} seconds
- Speech content detected: {:.2f} seconds
- Silence ratio: {:.2f}

Task: Transcribe ONLY the clearly audible speech in the provided audio file.

Rules:
1. Identify speakers as "Speaker 1", "Speaker 2", etc. ONLY if you can clearly distinguish different voices
2. Provide timestamps in [MM:SS] format ONLY for actual speech you can hear
3. COMPLETELY IGNORE silence, background noise, or unclear audio
4. If a word is repeated due to echo/stutter, write it once
5. If there is no clear speech or only silence/noise, return []
6. DO NOT INVENT or HALLUCINATE any speech content
7. Confidence check: If you're not 90% certain you heard specific words, don't include them

Output Format:
Return a JSON array of objects. Each object must have:
- "time": string (e.g. "[00:12]")
- "speaker": string
- "text": string
- "confidence": number (0.0-1.0, where 1.0 is completely certain)

REMEMBER: It's better to return an empty array than to generate fictional content!
)",
        analysis.duration_seconds(),
        analysis.speech_duration_seconds(),
        analysis.silence_ratio());
}
