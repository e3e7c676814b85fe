#include "audio/portaudio_capture.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <portaudio.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace {

const char* kTag = "Capture";

void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw SessionError(ErrorKind::AudioSubsystemError,
                           std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

}

// Constructor
PortAudioCapture::PortAudioCapture() : PortAudioCapture(Config{}) {}

PortAudioCapture::PortAudioCapture(Config config) : config_(config) {}

// Destructor
PortAudioCapture::~PortAudioCapture() {
    remove();
    deactivate();
}

void PortAudioCapture::activate() {
    if (active_) return;
    pa_check(Pa_Initialize(), "Pa_Initialize");
    active_ = true;
}

void PortAudioCapture::deactivate() {
    if (!active_) return;
    const PaError e = Pa_Terminate();
    if (e != paNoError) logWarn(kTag, std::string("Pa_Terminate: ") + Pa_GetErrorText(e));
    active_ = false;
}

AudioFormat PortAudioCapture::negotiateFormat() {
    if (!active_) throw SessionError(ErrorKind::AudioSubsystemError, "audio subsystem is not active");

    const PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice) throw SessionError(ErrorKind::AudioSubsystemError, "No default input device");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info) throw SessionError(ErrorKind::AudioSubsystemError, "Unable to query input device");

    AudioFormat format;
    const double rate = info->defaultSampleRate;
    format.sampleRate = (std::isfinite(rate) && rate > 0) ? (int)std::lround(rate) : 16000;
    format.channelCount = info->maxInputChannels > 0 ? std::min(info->maxInputChannels, config_.maxChannels) : 1;
    format.framesPerBuffer = std::max(1, format.sampleRate * config_.bufferMs / 1000);

    PaStreamParameters inParams{};
    inParams.device = device;
    inParams.channelCount = format.channelCount;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info->defaultLowInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    const PaError supported = Pa_IsFormatSupported(&inParams, nullptr, format.sampleRate);
    if (supported != paFormatIsSupported) {
        throw SessionError(ErrorKind::AudioSubsystemError,
                           std::string("Unable to create audio format: ") + Pa_GetErrorText(supported));
    }

    logInfo(kTag, std::string("input device: ") + (info->name ? info->name : "(unknown)") + ", " +
                  std::to_string(format.sampleRate) + " Hz, " + std::to_string(format.channelCount) + " ch");
    return format;
}

void PortAudioCapture::install(const AudioFormat& format, FrameCallback onFrame, CaptureErrorCallback onError) {
    if (stream_) throw SessionError(ErrorKind::AudioSubsystemError, "capture tap already installed");
    if (!active_) throw SessionError(ErrorKind::AudioSubsystemError, "audio subsystem is not active");

    PaStreamParameters inParams{};
    inParams.device = Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice) throw SessionError(ErrorKind::AudioSubsystemError, "No default input device");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    inParams.channelCount = format.channelCount;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
    inParams.hostApiSpecificStreamInfo = nullptr;

    pa_check(Pa_OpenStream(&stream_, &inParams, nullptr, format.sampleRate, format.framesPerBuffer,
                           paNoFlag, nullptr, nullptr),
             "Pa_OpenStream");

    const PaError started = Pa_StartStream(stream_);
    if (started != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        pa_check(started, "Pa_StartStream");
    }

    format_ = format;
    onFrame_ = std::move(onFrame);
    onError_ = std::move(onError);
    running_ = true;
    thread_ = std::thread(&PortAudioCapture::run, this);
}

// Joins the capture thread before the stream is closed
void PortAudioCapture::remove() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
    closeStream();
    onFrame_ = nullptr;
    onError_ = nullptr;
}

void PortAudioCapture::closeStream() {
    if (!stream_) return;
    PaError e = Pa_StopStream(stream_);
    if (e != paNoError) logWarn(kTag, std::string("Pa_StopStream: ") + Pa_GetErrorText(e));
    e = Pa_CloseStream(stream_);
    if (e != paNoError) logWarn(kTag, std::string("Pa_CloseStream: ") + Pa_GetErrorText(e));
    stream_ = nullptr;
}

// Capture thread
void PortAudioCapture::run() {
    std::vector<int16_t> buff((std::size_t)format_.framesPerBuffer * format_.channelCount);

    while (running_.load()) {
        const PaError e = Pa_ReadStream(stream_, buff.data(), format_.framesPerBuffer);
        if (e == paInputOverflowed) {
            logDebug(kTag, "input overflowed");
            continue;
        }
        if (e != paNoError) {
            running_ = false;
            logError(kTag, std::string("Pa_ReadStream: ") + Pa_GetErrorText(e));
            if (onError_) onError_(std::string("Audio capture failed: ") + Pa_GetErrorText(e));
            return;
        }

        if (onFrame_) onFrame_(buff.data(), (std::size_t)format_.framesPerBuffer);
    }
}
