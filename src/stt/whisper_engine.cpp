#include "stt/whisper_engine.hpp"
#include "stt/result_json.hpp"
#include "stt/word_assembler.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <whisper.h>

#include <utility>

namespace {

const char* kTag = "Whisper STT";

// Routes whisper/ggml logging through our log; info and debug only when verbose
void whisperLog(ggml_log_level level, const char* text, void*) {
    std::string line = text ? text : "";
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (line.empty()) return;

    switch (level) {
        case GGML_LOG_LEVEL_ERROR: logError("whisper", line); break;
        case GGML_LOG_LEVEL_WARN: logWarn("whisper", line); break;
        default: logDebug("whisper", line); break;
    }
}

std::string trim(const std::string& s) {
    const std::size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    const std::size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

// Whisper's non-speech markers: "[BLANK_AUDIO]", "[ Silence ]", "(music)"...
bool isNonSpeech(const std::string& s) {
    if (s.size() < 2) return false;
    return (s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')');
}

}

// Constructor
WhisperModel::WhisperModel(const std::string& modelPath, WhisperConfig config) : config_(std::move(config)) {
    whisper_log_set(whisperLog, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw SessionError(ErrorKind::ModelLoadError, "whisper_init_from_file_with_params failed: " + modelPath);

    logInfo(kTag, "model loaded: " + modelPath);
}

// Destructor
WhisperModel::~WhisperModel() {
    if (context_) whisper_free(context_);
}

std::unique_ptr<RecognitionEngine> WhisperModel::createRecognizer(int sampleRate, int channelCount,
                                                                  const Grammar& grammar) {
    return std::make_unique<WhisperRecognizer>(context_, sampleRate, channelCount, grammar, config_);
}

ModelLoader WhisperModel::loader(WhisperConfig config) {
    return [config](const std::string& path) -> std::unique_ptr<RecognitionModel> {
        return std::make_unique<WhisperModel>(path, config);
    };
}

// Constructor
WhisperRecognizer::WhisperRecognizer(whisper_context* context, int sampleRate, int channelCount,
                                     Grammar grammar, WhisperConfig config)
    : context_(context),
      grammar_(std::move(grammar)),
      prompt_(grammar_.prompt()),
      config_(std::move(config)),
      resampler_(sampleRate, channelCount, kWhisperRate),
      detector_(config_.endpoint) {
    if (sampleRate <= 0 || channelCount <= 0) {
        throw SessionError(ErrorKind::AudioSubsystemError, "invalid recognizer format");
    }

    state_ = whisper_init_state(context_);
    if (!state_) throw SessionError(ErrorKind::AudioSubsystemError, "whisper_init_state failed");
}

// Destructor
WhisperRecognizer::~WhisperRecognizer() {
    if (state_) whisper_free_state(state_);
}

bool WhisperRecognizer::decode(const std::vector<float>& pcm, bool withTimestamps) {
    if (pcm.empty()) return false;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    params.no_context = true;
    params.single_segment = !withTimestamps;
    params.token_timestamps = withTimestamps;
    params.no_speech_thold = config_.noSpeechThreshold;
    params.initial_prompt = prompt_.empty() ? nullptr : prompt_.c_str();

    const int rc = whisper_full_with_state(context_, state_, params, pcm.data(), (int)pcm.size());
    if (rc != 0) throw SessionError(ErrorKind::DecodeGlitch, "whisper_full_with_state failed: " + std::to_string(rc));
    return true;
}

std::string WhisperRecognizer::decodedText() const {
    std::string out;
    const int n = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_, i);
        if (!txt) continue;
        const std::string s = trim(txt);
        if (s.empty() || isNonSpeech(s)) continue;
        if (!out.empty()) out += " ";
        out += s;
    }
    return out;
}

// Text tokens of the speech segments; timestamps and end-of-text markers
// are skipped
std::vector<WordTimestamp> WhisperRecognizer::decodedWords(double offsetSec) const {
    std::vector<TokenPiece> tokens;

    const whisper_token eot = whisper_token_eot(context_);
    const int nSegments = whisper_full_n_segments_from_state(state_);
    for (int s = 0; s < nSegments; ++s) {
        const char* segText = whisper_full_get_segment_text_from_state(state_, s);
        if (!segText || isNonSpeech(trim(segText))) continue;

        const int nTokens = whisper_full_n_tokens_from_state(state_, s);
        for (int t = 0; t < nTokens; ++t) {
            const whisper_token_data data = whisper_full_get_token_data_from_state(state_, s, t);
            if (data.id >= eot) continue;

            const char* raw = whisper_full_get_token_text_from_state(context_, state_, s, t);
            TokenPiece piece;
            piece.text = raw ? raw : "";
            piece.t0 = data.t0;
            piece.t1 = data.t1;
            piece.probability = data.p;
            tokens.push_back(std::move(piece));
        }
    }
    return assembleWords(tokens, offsetSec);
}

bool WhisperRecognizer::acceptWaveform(const int16_t* samples, std::size_t frameCount) {
    if (samples == nullptr || frameCount == 0) return false;

    std::vector<float> pcm;
    resampler_.process(samples, frameCount, pcm);
    if (pcm.empty()) return false;

    const EndpointDetector::Event event = detector_.feed(pcm.data(), (int)pcm.size());

    if (event == EndpointDetector::Event::UtteranceEnded) {
        const double offsetSec = (double)detector_.utteranceStartSample() / kWhisperRate;
        const std::vector<float> utterance = detector_.utterance();

        detector_.clearUtterance();
        partialText_.clear();
        samplesSincePartial_ = 0;

        decode(utterance, true);

        std::vector<WordTimestamp> words = decodedWords(offsetSec);
        std::string text;
        if (grammar_.strict()) {
            grammar_.restrict(words);
            text = joinWords(words);
        } else {
            text = decodedText();
        }

        finalDocument_ = encodeFinal(text, wordTimestamps_ ? words : std::vector<WordTimestamp>());
        logDebug(kTag, "utterance: " + text);
        return true;
    }

    if (event == EndpointDetector::Event::SpeechStarted || event == EndpointDetector::Event::Speech) {
        samplesSincePartial_ += (int64_t)pcm.size();
        if (samplesSincePartial_ >= (int64_t)config_.partialIntervalMs * kWhisperRate / 1000) {
            samplesSincePartial_ = 0;
            decode(detector_.utterance(), false);
            partialText_ = decodedText();
        }
    }
    return false;
}

std::string WhisperRecognizer::partialResult() {
    return encodePartial(partialText_);
}

std::string WhisperRecognizer::finalResult() {
    std::string doc = finalDocument_.empty() ? encodeFinal("", {}) : finalDocument_;
    finalDocument_.clear();
    return doc;
}
