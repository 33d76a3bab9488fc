#ifndef AUDIO_CODEC_H
#define AUDIO_CODEC_H

#include <Arduino.h>
#include <vector>
#include "config.h"

// Sample format and rate conversion between the 8kHz u-law telephony leg
// and the 24kHz PCM16 realtime endpoint. Everything here is pure except
// DecimationFilter, which carries per-call history.

#define VB_DECIMATION_TAPS 96
#define VB_DECIMATION_CUTOFF_HZ 3400.0f
#define VB_WAV_HEADER_SIZE 44
#define VB_MULAW_BIAS 0x84
#define VB_MULAW_CLIP 32635

enum AudioEncoding {
  AUDIO_PCM16,  // signed 16-bit little endian
  AUDIO_MULAW
};

// Immutable block of mono samples handed between pipeline stages
struct AudioChunk {
  std::vector<uint8_t> data;
  uint32_t sampleRate;
  uint8_t channels;
  AudioEncoding encoding;
};

struct WavInfo {
  uint32_t sampleRate;
  uint16_t channels;
  uint16_t bitsPerSample;
  size_t dataOffset;
  size_t dataLength;
};

// Anti-aliasing state for one 24kHz -> 8kHz stream. One instance per call;
// reset() between calls, never between chunks of the same call.
class DecimationFilter {
public:
  DecimationFilter();

  void reset();

  // Feeds one input sample. Returns true and writes `out` on every third
  // sample (phase 0).
  bool push(int16_t sample, int16_t& out);

  uint8_t getPhase() const { return phase; }

private:
  int16_t history[VB_DECIMATION_TAPS];
  uint8_t cursor;
  uint8_t phase;

  int16_t convolve() const;
};

// Lowpass coefficients (Blackman-windowed sinc, unity DC gain), computed once
const float* getDecimationCoefficients();

// u-law (G.711)
int16_t mulawDecodeSample(uint8_t value);
uint8_t mulawEncodeSample(int16_t sample);
std::vector<int16_t> mulawDecode(const uint8_t* data, size_t length);
std::vector<int16_t> mulawDecode(const std::vector<uint8_t>& data);
std::vector<uint8_t> mulawEncode(const std::vector<int16_t>& pcm);

// Rate conversion by 3. Without a filter downsample3x keeps every third
// sample and returns floor(n / 3) samples.
std::vector<int16_t> upsample3x(const std::vector<int16_t>& pcm);
std::vector<int16_t> downsample3x(const std::vector<int16_t>& pcm, DecimationFilter* filter = nullptr);

// 8kHz u-law -> 24kHz PCM16
std::vector<int16_t> downlinkToNetwork(const std::vector<uint8_t>& mulaw);
// 24kHz PCM16 -> 8kHz u-law
std::vector<uint8_t> uplinkFromNetwork(const std::vector<int16_t>& pcm, DecimationFilter* filter);

// PCM16 little-endian byte buffers
std::vector<int16_t> pcm16FromBytes(const uint8_t* data, size_t length);
std::vector<int16_t> pcm16FromBytes(const std::vector<uint8_t>& data);
std::vector<uint8_t> pcm16ToBytes(const std::vector<int16_t>& pcm);

// 44-byte RIFF/WAVE container around raw PCM16
std::vector<uint8_t> buildWavContainer(const std::vector<uint8_t>& pcm, uint32_t sampleRate, uint16_t channels);
bool parseWavHeader(const uint8_t* data, size_t length, WavInfo& info);

#endif
