#ifndef CONSOLE_APP_HPP
#define CONSOLE_APP_HPP

#include "app/event_router.hpp"
#include "app/main_loop.hpp"
#include "app/state_container.hpp"
#include "ui/console_consent.hpp"
#include "ui/terminal_view.hpp"

#include <istream>
#include <string>

// Terminal front end. Input lines are read on the calling thread and posted to
// the main loop, which runs on its own thread and owns every UI update.
//
//   <enter>  start / stop recording
//   q        quit
class ConsoleApp {
public:
    ConsoleApp(MainLoop& loop,
               StateContainer& state,
               RecognitionEventRouter& router,
               ConsoleConsent& consent,
               TerminalView& view);

    // Blocks until "q" or end of input.
    void run(std::istream& in);

    // Both must run on the main loop.
    void handleLine(const std::string& line);
    void refresh();

private:
    MainLoop& loop_;
    RecognitionEventRouter& router_;
    ConsoleConsent& consent_;
    TerminalView& view_;
    StateContainer::Subscription states_;
};

#endif
