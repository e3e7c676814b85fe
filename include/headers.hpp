#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include "audio/portaudio_capture.hpp"
#include "audio/waveform_writer.hpp"

#include "stt/whisper_engine.hpp"

#include "session/session_controller.hpp"
#include "session/start_options.hpp"

#include "bridge/command_dispatcher.hpp"
#include "bridge/command_server.hpp"

#endif
