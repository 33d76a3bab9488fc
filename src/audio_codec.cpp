#include "audio_codec.h"
#include <math.h>
#include <string.h>

namespace {

struct MulawTable {
  int16_t decode[256];

  MulawTable() {
    for (int i = 0; i < 256; i++) {
      uint8_t mu = ~i & 0xff;
      int sign = mu & 0x80;
      int exponent = (mu >> 4) & 0x07;
      int mantissa = mu & 0x0f;
      int magnitude = (((mantissa << 3) + VB_MULAW_BIAS) << exponent) - VB_MULAW_BIAS;
      decode[i] = (int16_t)(sign ? -magnitude : magnitude);
    }
  }
};

struct FirCoefficients {
  float taps[VB_DECIMATION_TAPS];

  FirCoefficients() {
    const int n = VB_DECIMATION_TAPS;
    const double fc = VB_DECIMATION_CUTOFF_HZ / (double)VB_NETWORK_SAMPLE_RATE;
    const double center = (n - 1) / 2.0;
    double sum = 0.0;
    double raw[VB_DECIMATION_TAPS];

    for (int i = 0; i < n; i++) {
      double x = i - center;
      double sinc = (x == 0.0) ? 2.0 * fc : sin(2.0 * M_PI * fc * x) / (M_PI * x);
      double window = 0.42 - 0.5 * cos(2.0 * M_PI * i / (n - 1)) + 0.08 * cos(4.0 * M_PI * i / (n - 1));
      raw[i] = sinc * window;
      sum += raw[i];
    }
    for (int i = 0; i < n; i++) {
      taps[i] = (float)(raw[i] / sum);
    }
  }
};

const MulawTable& mulawTable() {
  static const MulawTable table;
  return table;
}

const FirCoefficients& firCoefficients() {
  static const FirCoefficients coefficients;
  return coefficients;
}

// Built during static initialization so the first call does not pay for it
const MulawTable& mulawTableWarmup = mulawTable();
const FirCoefficients& firWarmup = firCoefficients();

inline int16_t clampToInt16(long value) {
  if (value > 32767) return 32767;
  if (value < -32768) return -32768;
  return (int16_t)value;
}

inline int16_t roundToInt16(double value) {
  return clampToInt16((long)floor(value + 0.5));
}

void writeLe16(uint8_t* p, uint16_t v) {
  p[0] = v & 0xff;
  p[1] = (v >> 8) & 0xff;
}

void writeLe32(uint8_t* p, uint32_t v) {
  p[0] = v & 0xff;
  p[1] = (v >> 8) & 0xff;
  p[2] = (v >> 16) & 0xff;
  p[3] = (v >> 24) & 0xff;
}

uint16_t readLe16(const uint8_t* p) {
  return (uint16_t)(p[0] | (p[1] << 8));
}

uint32_t readLe32(const uint8_t* p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

} // namespace

const float* getDecimationCoefficients() {
  return firCoefficients().taps;
}

// ---------------------------------------------------------------------------
// DecimationFilter

DecimationFilter::DecimationFilter() {
  reset();
}

void DecimationFilter::reset() {
  memset(history, 0, sizeof(history));
  cursor = 0;
  phase = 0;
}

bool DecimationFilter::push(int16_t sample, int16_t& out) {
  history[cursor] = sample;
  cursor = (cursor + 1) % VB_DECIMATION_TAPS;

  bool emit = (phase == 0);
  if (emit) {
    out = convolve();
  }
  phase = (phase + 1) % VB_RESAMPLE_FACTOR;
  return emit;
}

int16_t DecimationFilter::convolve() const {
  const float* taps = firCoefficients().taps;
  float acc = 0.0f;
  // taps[0] weights the newest sample
  int idx = (cursor + VB_DECIMATION_TAPS - 1) % VB_DECIMATION_TAPS;
  for (int k = 0; k < VB_DECIMATION_TAPS; k++) {
    acc += taps[k] * history[idx];
    idx = (idx == 0) ? VB_DECIMATION_TAPS - 1 : idx - 1;
  }
  return roundToInt16(acc);
}

// ---------------------------------------------------------------------------
// u-law

int16_t mulawDecodeSample(uint8_t value) {
  return mulawTable().decode[value];
}

uint8_t mulawEncodeSample(int16_t sample) {
  int pcm = sample;
  int sign = (pcm >> 8) & 0x80;
  if (sign) pcm = -pcm;
  if (pcm > VB_MULAW_CLIP) pcm = VB_MULAW_CLIP;
  pcm += VB_MULAW_BIAS;

  int exponent = 7;
  for (int mask = 0x4000; (pcm & mask) == 0 && exponent > 0; exponent--, mask >>= 1) {
  }
  int mantissa = (pcm >> (exponent + 3)) & 0x0f;
  return (uint8_t)(~(sign | (exponent << 4) | mantissa) & 0xff);
}

std::vector<int16_t> mulawDecode(const uint8_t* data, size_t length) {
  std::vector<int16_t> pcm(length);
  const int16_t* table = mulawTable().decode;
  for (size_t i = 0; i < length; i++) {
    pcm[i] = table[data[i]];
  }
  return pcm;
}

std::vector<int16_t> mulawDecode(const std::vector<uint8_t>& data) {
  return mulawDecode(data.data(), data.size());
}

std::vector<uint8_t> mulawEncode(const std::vector<int16_t>& pcm) {
  std::vector<uint8_t> out(pcm.size());
  for (size_t i = 0; i < pcm.size(); i++) {
    out[i] = mulawEncodeSample(pcm[i]);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Rate conversion

std::vector<int16_t> upsample3x(const std::vector<int16_t>& pcm) {
  std::vector<int16_t> out;
  out.reserve(pcm.size() * VB_RESAMPLE_FACTOR);

  for (size_t i = 0; i < pcm.size(); i++) {
    int curr = pcm[i];
    int next = (i + 1 < pcm.size()) ? pcm[i + 1] : curr;
    double step = (next - curr) / 3.0;
    out.push_back((int16_t)curr);
    out.push_back(roundToInt16(curr + step));
    out.push_back(roundToInt16(curr + 2.0 * step));
  }
  return out;
}

std::vector<int16_t> downsample3x(const std::vector<int16_t>& pcm, DecimationFilter* filter) {
  std::vector<int16_t> out;

  if (filter == nullptr) {
    size_t count = pcm.size() / VB_RESAMPLE_FACTOR;
    out.reserve(count);
    for (size_t i = 0; i < count; i++) {
      out.push_back(pcm[i * VB_RESAMPLE_FACTOR]);
    }
    return out;
  }

  out.reserve(pcm.size() / VB_RESAMPLE_FACTOR + 1);
  int16_t sample;
  for (size_t i = 0; i < pcm.size(); i++) {
    if (filter->push(pcm[i], sample)) {
      out.push_back(sample);
    }
  }
  return out;
}

std::vector<int16_t> downlinkToNetwork(const std::vector<uint8_t>& mulaw) {
  return upsample3x(mulawDecode(mulaw));
}

std::vector<uint8_t> uplinkFromNetwork(const std::vector<int16_t>& pcm, DecimationFilter* filter) {
  return mulawEncode(downsample3x(pcm, filter));
}

// ---------------------------------------------------------------------------
// Byte buffers and WAV

std::vector<int16_t> pcm16FromBytes(const uint8_t* data, size_t length) {
  std::vector<int16_t> pcm(length / 2);
  for (size_t i = 0; i < pcm.size(); i++) {
    pcm[i] = (int16_t)readLe16(data + 2 * i);
  }
  return pcm;
}

std::vector<int16_t> pcm16FromBytes(const std::vector<uint8_t>& data) {
  return pcm16FromBytes(data.data(), data.size());
}

std::vector<uint8_t> pcm16ToBytes(const std::vector<int16_t>& pcm) {
  std::vector<uint8_t> out(pcm.size() * 2);
  for (size_t i = 0; i < pcm.size(); i++) {
    writeLe16(&out[2 * i], (uint16_t)pcm[i]);
  }
  return out;
}

std::vector<uint8_t> buildWavContainer(const std::vector<uint8_t>& pcm, uint32_t sampleRate, uint16_t channels) {
  const uint16_t bitsPerSample = 16;
  const uint16_t blockAlign = channels * bitsPerSample / 8;
  const uint32_t byteRate = sampleRate * blockAlign;
  const uint32_t dataLength = pcm.size();

  std::vector<uint8_t> wav(VB_WAV_HEADER_SIZE + dataLength);
  uint8_t* h = wav.data();
  memcpy(h, "RIFF", 4);
  writeLe32(h + 4, 36 + dataLength);
  memcpy(h + 8, "WAVE", 4);
  memcpy(h + 12, "fmt ", 4);
  writeLe32(h + 16, 16);            // fmt chunk size
  writeLe16(h + 20, 1);             // PCM
  writeLe16(h + 22, channels);
  writeLe32(h + 24, sampleRate);
  writeLe32(h + 28, byteRate);
  writeLe16(h + 32, blockAlign);
  writeLe16(h + 34, bitsPerSample);
  memcpy(h + 36, "data", 4);
  writeLe32(h + 40, dataLength);

  if (dataLength > 0) {
    memcpy(h + VB_WAV_HEADER_SIZE, pcm.data(), dataLength);
  }
  return wav;
}

bool parseWavHeader(const uint8_t* data, size_t length, WavInfo& info) {
  if (data == nullptr || length < VB_WAV_HEADER_SIZE) return false;
  if (memcmp(data, "RIFF", 4) != 0 || memcmp(data + 8, "WAVE", 4) != 0) return false;
  if (memcmp(data + 12, "fmt ", 4) != 0 || memcmp(data + 36, "data", 4) != 0) return false;
  if (readLe16(data + 20) != 1) return false;

  info.channels = readLe16(data + 22);
  info.sampleRate = readLe32(data + 24);
  info.bitsPerSample = readLe16(data + 34);
  info.dataOffset = VB_WAV_HEADER_SIZE;
  info.dataLength = readLe32(data + 40);
  if (info.dataLength > length - VB_WAV_HEADER_SIZE) {
    info.dataLength = length - VB_WAV_HEADER_SIZE;
  }
  return info.channels > 0 && info.bitsPerSample == 16;
}
