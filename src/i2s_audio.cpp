#include "i2s_audio.h"
#include "encoding_service.h"
#include "production_logger.h"

#define I2S_SPEAKER_PORT I2S_NUM_0
#define I2S_MIC_PORT     I2S_NUM_1

namespace {

// Mono 16-bit stream, the WAV header selects the rate per unit
const i2s_config_t speakerConfig = {
  .mode = i2s_mode_t(I2S_MODE_MASTER | I2S_MODE_TX),
  .sample_rate = VB_NETWORK_SAMPLE_RATE,
  .bits_per_sample = I2S_BITS_PER_SAMPLE_16BIT,
  .channel_format = I2S_CHANNEL_FMT_ONLY_LEFT,
  .communication_format = I2S_COMM_FORMAT_STAND_I2S,
  .intr_alloc_flags = ESP_INTR_FLAG_LEVEL1,
  .dma_buf_count = I2S_DMA_BUFFER_COUNT,
  .dma_buf_len = I2S_DMA_BUFFER_LEN,
  .use_apll = false,
  .tx_desc_auto_clear = true,
  .fixed_mclk = 0
};

const i2s_pin_config_t speakerPins = {
  .bck_io_num = I2S_SPK_BCLK,
  .ws_io_num = I2S_SPK_LRC,
  .data_out_num = I2S_SPK_DIN,
  .data_in_num = I2S_PIN_NO_CHANGE
};

const i2s_pin_config_t micPins = {
  .bck_io_num = I2S_MIC_SCK,
  .ws_io_num = I2S_MIC_WS,
  .data_out_num = I2S_PIN_NO_CHANGE,
  .data_in_num = I2S_MIC_SD
};

// 24-bit samples arrive left-aligned in 32-bit frames
inline int16_t micSampleToPcm16(int32_t raw) {
  int32_t sample = raw >> 14;
  if (sample > 32767) sample = 32767;
  if (sample < -32768) sample = -32768;
  return (int16_t)sample;
}

} // namespace

// ---------------------------------------------------------------------------
// I2SPlayer

I2SPlayer::I2SPlayer(I2SAudioOutput& output, std::shared_ptr<PlayJob> job)
  : output(output), job(job), playing(false) {
}

I2SPlayer::~I2SPlayer() {
  job->aborted = true;
  output.forget(this);
}

bool I2SPlayer::play() {
  if (playing) return true;
  if (job->aborted || job->done) return false;
  if (!output.submit(this)) return false;
  playing = true;
  return true;
}

void I2SPlayer::pause() {
  // The writer task cannot resume a unit mid-way, so pause abandons it
  job->aborted = true;
  playing = false;
  output.forget(this);
}

void I2SPlayer::notifyFinished() {
  playing = false;
  std::function<void()> callback = onFinished;
  if (callback) callback();
}

// ---------------------------------------------------------------------------
// I2SAudioOutput

I2SAudioOutput::I2SAudioOutput()
  : jobQueue(nullptr), writerTask(nullptr), initialized(false) {
}

I2SAudioOutput::~I2SAudioOutput() {
  end();
}

bool I2SAudioOutput::begin() {
  if (initialized) return true;

  pinMode(SPEAKER_GAIN_PIN, OUTPUT);
  digitalWrite(SPEAKER_GAIN_PIN, LOW);

  esp_err_t err = i2s_driver_install(I2S_SPEAKER_PORT, &speakerConfig, 0, NULL);
  if (err != ESP_OK) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to install speaker I2S driver", String(err));
    return false;
  }
  err = i2s_set_pin(I2S_SPEAKER_PORT, &speakerPins);
  if (err != ESP_OK) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to set speaker I2S pins", String(err));
    i2s_driver_uninstall(I2S_SPEAKER_PORT);
    return false;
  }
  i2s_zero_dma_buffer(I2S_SPEAKER_PORT);

  jobQueue = xQueueCreate(PLAYBACK_QUEUE_DEPTH, sizeof(std::shared_ptr<PlayJob>*));
  if (jobQueue == nullptr) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to create playback queue");
    i2s_driver_uninstall(I2S_SPEAKER_PORT);
    return false;
  }

  initialized = true;
  BaseType_t created = xTaskCreatePinnedToCore(writerTaskEntry, "i2s_playback", 4096, this,
                                               AUDIO_PLAYBACK_PRIORITY, &writerTask, 1);
  if (created != pdPASS) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to start playback task");
    initialized = false;
    vQueueDelete(jobQueue);
    jobQueue = nullptr;
    i2s_driver_uninstall(I2S_SPEAKER_PORT);
    return false;
  }

  VB_LOG_INFO(LOG_AUDIO, "Speaker output ready", String(VB_NETWORK_SAMPLE_RATE) + " Hz");
  return true;
}

void I2SAudioOutput::end() {
  if (!initialized) return;

  for (size_t i = 0; i < rendering.size(); i++) {
    rendering[i]->job->aborted = true;
  }
  rendering.clear();

  initialized = false;
  if (writerTask != nullptr) {
    vTaskDelete(writerTask);
    writerTask = nullptr;
  }

  std::shared_ptr<PlayJob>* pending = nullptr;
  while (xQueueReceive(jobQueue, &pending, 0) == pdTRUE) {
    delete pending;
  }
  vQueueDelete(jobQueue);
  jobQueue = nullptr;

  i2s_driver_uninstall(I2S_SPEAKER_PORT);
}

std::unique_ptr<AudioPlayer> I2SAudioOutput::createPlayer(const std::vector<uint8_t>& container) {
  if (!initialized) {
    VB_LOG_ERROR(LOG_AUDIO, "Speaker output not initialized");
    return std::unique_ptr<AudioPlayer>();
  }

  WavInfo info;
  if (!parseWavHeader(container.data(), container.size(), info)) {
    VB_LOG_ERROR(LOG_AUDIO, "Playback unit is not a PCM16 WAV container");
    return std::unique_ptr<AudioPlayer>();
  }
  if (info.channels != 1 || info.bitsPerSample != 16) {
    VB_LOG_ERROR(LOG_AUDIO, "Unsupported playback format",
                 String(info.channels) + "ch " + String(info.bitsPerSample) + "bit");
    return std::unique_ptr<AudioPlayer>();
  }

  std::shared_ptr<PlayJob> job(new PlayJob());
  job->pcm.assign(container.begin() + info.dataOffset, container.begin() + info.dataOffset + info.dataLength);
  job->sampleRate = info.sampleRate;
  job->aborted = false;
  job->done = false;
  return std::unique_ptr<AudioPlayer>(new I2SPlayer(*this, job));
}

bool I2SAudioOutput::setRoute(bool speaker) {
  if (!initialized) return false;
  digitalWrite(SPEAKER_GAIN_PIN, speaker ? HIGH : LOW);
  VB_LOG_DEBUG(LOG_AUDIO, speaker ? "Route: loudspeaker" : "Route: earpiece");
  return true;
}

bool I2SAudioOutput::submit(I2SPlayer* player) {
  if (!initialized) return false;

  std::shared_ptr<PlayJob>* handle = new std::shared_ptr<PlayJob>(player->job);
  if (xQueueSend(jobQueue, &handle, 0) != pdTRUE) {
    VB_LOG_WARNING(LOG_AUDIO, "Playback queue full, unit rejected");
    delete handle;
    return false;
  }
  rendering.push_back(player);
  return true;
}

void I2SAudioOutput::forget(I2SPlayer* player) {
  for (size_t i = 0; i < rendering.size(); i++) {
    if (rendering[i] == player) {
      rendering.erase(rendering.begin() + i);
      return;
    }
  }
}

void I2SAudioOutput::service() {
  // A callback may create, play or destroy players, so rescan after each one
  for (;;) {
    I2SPlayer* finished = nullptr;
    for (size_t i = 0; i < rendering.size(); i++) {
      if (rendering[i]->job->done) {
        finished = rendering[i];
        rendering.erase(rendering.begin() + i);
        break;
      }
    }
    if (finished == nullptr) return;
    finished->notifyFinished();
  }
}

void I2SAudioOutput::writerTaskEntry(void* param) {
  I2SAudioOutput* self = static_cast<I2SAudioOutput*>(param);
  uint32_t currentRate = VB_NETWORK_SAMPLE_RATE;

  while (true) {
    std::shared_ptr<PlayJob>* handle = nullptr;
    if (xQueueReceive(self->jobQueue, &handle, portMAX_DELAY) != pdTRUE) {
      continue;
    }
    std::shared_ptr<PlayJob> job = *handle;
    delete handle;

    if (!job->aborted) {
      if (job->sampleRate != currentRate) {
        i2s_set_sample_rates(I2S_SPEAKER_PORT, job->sampleRate);
        currentRate = job->sampleRate;
      }

      size_t offset = 0;
      while (offset < job->pcm.size() && !job->aborted) {
        size_t length = job->pcm.size() - offset;
        if (length > I2S_WRITE_CHUNK) length = I2S_WRITE_CHUNK;

        size_t written = 0;
        if (i2s_write(I2S_SPEAKER_PORT, job->pcm.data() + offset, length, &written, pdMS_TO_TICKS(100)) != ESP_OK) {
          break;
        }
        offset += written;
      }
      if (job->aborted) {
        i2s_zero_dma_buffer(I2S_SPEAKER_PORT);
      }
    }
    job->done = true;
  }
}

// ---------------------------------------------------------------------------
// I2SMicCapture

I2SMicCapture::I2SMicCapture()
  : ring(nullptr),
    captureTask(nullptr),
    chunkBytes(0),
    running(false),
    taskExited(true),
    droppedBytes(0),
    recording(false) {
  config.sampleRate = VB_NETWORK_SAMPLE_RATE;
  config.channels = 1;
  config.intervalMs = VB_CAPTURE_INTERVAL_MS;
}

I2SMicCapture::~I2SMicCapture() {
  stopRecording();
}

bool I2SMicCapture::startRecording(const RecordingConfig& recordingConfig, ChunkCallback callback) {
  if (recording) {
    onChunk = callback;
    return true;
  }
  if (recordingConfig.channels != 1 || recordingConfig.sampleRate == 0 || recordingConfig.intervalMs == 0) {
    VB_LOG_ERROR(LOG_AUDIO, "Unsupported recording configuration");
    return false;
  }

  config = recordingConfig;
  chunkBytes = (size_t)config.sampleRate * config.intervalMs / 1000 * sizeof(int16_t);

  i2s_config_t micConfig = {
    .mode = i2s_mode_t(I2S_MODE_MASTER | I2S_MODE_RX),
    .sample_rate = (int)config.sampleRate,
    .bits_per_sample = I2S_BITS_PER_SAMPLE_32BIT,
    .channel_format = I2S_CHANNEL_FMT_ONLY_LEFT,
    .communication_format = I2S_COMM_FORMAT_STAND_I2S,
    .intr_alloc_flags = ESP_INTR_FLAG_LEVEL1,
    .dma_buf_count = I2S_DMA_BUFFER_COUNT,
    .dma_buf_len = I2S_DMA_BUFFER_LEN,
    .use_apll = false,
    .tx_desc_auto_clear = false,
    .fixed_mclk = 0
  };

  esp_err_t err = i2s_driver_install(I2S_MIC_PORT, &micConfig, 0, NULL);
  if (err != ESP_OK) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to install microphone I2S driver", String(err));
    return false;
  }
  err = i2s_set_pin(I2S_MIC_PORT, &micPins);
  if (err != ESP_OK) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to set microphone I2S pins", String(err));
    i2s_driver_uninstall(I2S_MIC_PORT);
    return false;
  }
  i2s_zero_dma_buffer(I2S_MIC_PORT);

  ring = xRingbufferCreate(CAPTURE_RING_BYTES, RINGBUF_TYPE_BYTEBUF);
  if (ring == nullptr) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to allocate capture ring buffer");
    i2s_driver_uninstall(I2S_MIC_PORT);
    return false;
  }

  pending.clear();
  pending.reserve(chunkBytes);
  droppedBytes = 0;
  onChunk = callback;
  running = true;
  taskExited = false;

  BaseType_t created = xTaskCreatePinnedToCore(captureTaskEntry, "i2s_capture", 8192, this,
                                               AUDIO_CAPTURE_PRIORITY, &captureTask, 1);
  if (created != pdPASS) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to start capture task");
    running = false;
    taskExited = true;
    captureTask = nullptr;
    vRingbufferDelete(ring);
    ring = nullptr;
    i2s_driver_uninstall(I2S_MIC_PORT);
    return false;
  }

  recording = true;
  VB_LOG_INFO(LOG_AUDIO, "Recording started",
              String(config.sampleRate) + " Hz, " + String(config.intervalMs) + " ms chunks");
  return true;
}

void I2SMicCapture::stopRecording() {
  if (!recording) return;
  recording = false;
  running = false;

  for (int i = 0; i < 50 && !taskExited; i++) {
    vTaskDelay(pdMS_TO_TICKS(5));
  }
  if (!taskExited) {
    VB_LOG_WARNING(LOG_AUDIO, "Capture task did not exit, deleting it");
    vTaskDelete(captureTask);
  }
  captureTask = nullptr;

  i2s_driver_uninstall(I2S_MIC_PORT);
  vRingbufferDelete(ring);
  ring = nullptr;
  pending.clear();
  onChunk = nullptr;

  if (droppedBytes > 0) {
    VB_LOG_WARNING(LOG_AUDIO, "Capture overruns during call", String(droppedBytes) + " bytes dropped");
  }
  VB_LOG_INFO(LOG_AUDIO, "Recording stopped");
}

void I2SMicCapture::service() {
  while (recording && ring != nullptr) {
    size_t wanted = chunkBytes - pending.size();
    size_t received = 0;
    uint8_t* data = (uint8_t*)xRingbufferReceiveUpTo(ring, &received, 0, wanted);
    if (data == nullptr) return;

    pending.insert(pending.end(), data, data + received);
    vRingbufferReturnItem(ring, data);

    if (pending.size() < chunkBytes) continue;

    String chunk = encodeBase64ToString(pending);
    pending.clear();
    ChunkCallback callback = onChunk;
    if (callback) callback(chunk);
  }
}

void I2SMicCapture::captureTaskEntry(void* param) {
  I2SMicCapture* self = static_cast<I2SMicCapture*>(param);
  int32_t raw[I2S_DMA_BUFFER_LEN];
  int16_t pcm[I2S_DMA_BUFFER_LEN];

  while (self->running) {
    size_t bytesRead = 0;
    if (i2s_read(I2S_MIC_PORT, raw, sizeof(raw), &bytesRead, pdMS_TO_TICKS(20)) != ESP_OK || bytesRead == 0) {
      continue;
    }

    size_t samples = bytesRead / sizeof(int32_t);
    for (size_t i = 0; i < samples; i++) {
      pcm[i] = micSampleToPcm16(raw[i]);
    }
    if (xRingbufferSend(self->ring, pcm, samples * sizeof(int16_t), 0) != pdTRUE) {
      self->droppedBytes += samples * sizeof(int16_t);
    }
  }

  self->taskExited = true;
  vTaskDelete(NULL);
}
