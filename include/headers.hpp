#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "app/clock.hpp"
#include "app/event_router.hpp"
#include "app/main_loop.hpp"
#include "app/settings.hpp"
#include "app/state_container.hpp"
#include "model/model_loader.hpp"
#include "model/model_preparer.hpp"
#include "stt/whisper_session.hpp"
#include "stt/whisper_stt.hpp"
#include "ui/console_app.hpp"
#include "ui/console_consent.hpp"
#include "ui/terminal_view.hpp"

#endif
