/*
  ButtonLogger

  Watches for user input gestures on GPIO input pins and prints their
  description, until interrupted with Ctrl-C.

  Usage: button_logger [--pressed-when-off] [--pull none|up|down] PIN...

  This example code is in the public domain.
*/

#include <GpiodDriver.h>
#include <RpiControls.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

using namespace rpicontrols;

// Buttons wired between the pin and ground read low when pushed, so they
// pair a pullup with PRESSED_WHEN_OFF; buttons wired to 3.3V pair a pulldown
// with PRESSED_WHEN_ON. If you seem to get inverted behavior from your
// button, try --pressed-when-off.
static Button::InputType input_type = Button::PRESSED_WHEN_ON;
static PullType pull = PULL_DOWN;

static void
usage()
{
    fprintf(stderr, "Usage: button_logger [--pressed-when-off] [--pull none|up|down] PIN...\n");
}

int
main(int argc, char* argv[])
{
    std::vector<int> pins;

    for (int i = 1; i < argc; ++i) {
        if (!strcmp(argv[i], "--pressed-when-off")) {
            input_type = Button::PRESSED_WHEN_OFF;
        } else if (!strcmp(argv[i], "--pull") && i + 1 < argc) {
            const char* value = argv[++i];
            if (!strcmp(value, "none"))      pull = PULL_NONE;
            else if (!strcmp(value, "up"))   pull = PULL_UP;
            else if (!strcmp(value, "down")) pull = PULL_DOWN;
            else { usage(); return 2; }
        } else {
            char* end;
            long pin = strtol(argv[i], &end, 10);
            if (*end != '\0') { usage(); return 2; }
            pins.push_back(static_cast<int>(pin));
        }
    }

    if (pins.empty()) {
        usage();
        return 2;
    }

    try {
        auto controller = make_controller();

        for (int pin : pins) {
            Button& button = controller->make_button(pin, input_type, pull);
            for (auto gesture : { GestureDetector::PRESS, GestureDetector::RELEASE, GestureDetector::LONG_PRESS,
                                  GestureDetector::CLICK, GestureDetector::DOUBLE_CLICK }) {
                button.add_handler(gesture, [gesture](Button& b) {
                    printf("Received input %s from %s\n", GestureDetector::describe_gesture(gesture), b.name().c_str());
                    fflush(stdout);
                });
            }
        }

        controller->stop_on_signals();
        controller->run();
    } catch (const Error& e) {
        fprintf(stderr, "button_logger: %s\n", e.what());
        return 1;
    }

    return 0;
}
