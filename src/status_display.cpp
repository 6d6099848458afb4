#include "loopcast/status_display.hpp"

#include <ncurses.h>

#include <algorithm>

namespace loopcast {

namespace {

constexpr auto kRenderInterval = std::chrono::milliseconds(50);
constexpr double kWaitingAfterSeconds = 2.0;

enum ColorPair : short { kQuiet = 1, kMedium = 2, kLoud = 3, kError = 4 };

}  // namespace

StatusDisplay::StatusDisplay(const DeviceDescriptor& device, const CaptureLoop& loop)
    : device_{device}, stream_config_{loop.stream_config()}, endpoint_{loop.endpoint()} {
    initscr();
    cbreak();
    noecho();
    curs_set(0);            // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking getch
    keypad(stdscr, TRUE);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(kQuiet, COLOR_GREEN, -1);
        init_pair(kMedium, COLOR_YELLOW, -1);
        init_pair(kLoud, COLOR_RED, -1);
        init_pair(kError, COLOR_MAGENTA, -1);
        has_color_ = true;
    }

    getmaxyx(stdscr, term_height_, term_width_);
}

StatusDisplay::~StatusDisplay() {
    endwin();
}

bool StatusDisplay::update(const CaptureStatus& status) {
    const int ch = getch();
    if (ch == 'q' || ch == 'Q' || ch == 27) {  // q or Escape
        return true;
    }
    if (ch == KEY_RESIZE) {
        endwin();
        refresh();
        getmaxyx(stdscr, term_height_, term_width_);
    }

    const auto now = std::chrono::steady_clock::now();
    if (now - last_render_ >= kRenderInterval || status.state == LoopState::Stopped) {
        render(status);
        last_render_ = now;
    }
    return false;
}

void StatusDisplay::render(const CaptureStatus& status) {
    erase();

    if (term_height_ < 8 || term_width_ < 40) {
        mvprintw(0, 0, "Terminal too small");
        refresh();
        return;
    }

    attron(A_BOLD);
    mvprintw(0, 1, "loopcast");
    attroff(A_BOLD);
    mvprintw(0, term_width_ - 10, "[q] Quit");
    mvhline(1, 0, ACS_HLINE, term_width_);

    mvprintw(2, 1, "Device : %d  %s", device_.index, device_.name.c_str());
    mvprintw(3, 1, "Stream : %u Hz, %u ch, %zu frames", stream_config_.sample_rate_hz,
             stream_config_.channel_count, stream_config_.frame_size);
    mvprintw(4, 1, "Target : %s:%u", endpoint_.host.c_str(),
             static_cast<unsigned>(endpoint_.port));

    // Level meter, full scale at 1.0
    const int meter_width = term_width_ - 22;
    const float level = std::clamp(status.activity_level, 0.0f, 1.0f);
    const int filled = static_cast<int>(level * static_cast<float>(meter_width));

    const short pair = level > 0.8f ? kLoud : (level > 0.4f ? kMedium : kQuiet);
    mvprintw(6, 1, "Level  : ");
    if (has_color_) attron(COLOR_PAIR(pair));
    for (int x = 0; x < meter_width; ++x) {
        mvaddch(6, 10 + x, x < filled ? ACS_BLOCK : ACS_BULLET);
    }
    if (has_color_) attroff(COLOR_PAIR(pair));
    mvprintw(6, 11 + meter_width, "%.4f", static_cast<double>(status.activity_level));

    const double frame_seconds = static_cast<double>(stream_config_.frame_size) /
                                 static_cast<double>(stream_config_.sample_rate_hz);
    const double silent_seconds = static_cast<double>(status.silent_streak) * frame_seconds;

    if (status.state == LoopState::Stopped) {
        mvprintw(7, 1, "State  : stopped");
    } else if (!status.silent) {
        mvprintw(7, 1, "State  : streaming");
    } else if (silent_seconds > kWaitingAfterSeconds) {
        mvprintw(7, 1, "State  : waiting for audio (play something)");
    } else {
        mvprintw(7, 1, "State  : silent");
    }

    mvhline(term_height_ - 3, 0, ACS_HLINE, term_width_);
    mvprintw(term_height_ - 2, 1, "Sent: %llu  Send errors: %llu  Read errors: %llu  Overflows: %llu",
             static_cast<unsigned long long>(status.frames_sent),
             static_cast<unsigned long long>(status.send_errors),
             static_cast<unsigned long long>(status.read_errors),
             static_cast<unsigned long long>(status.overflows));

    if (status.last_error) {
        if (has_color_) attron(COLOR_PAIR(kError));
        mvprintw(term_height_ - 1, 1, "Last error: %.*s", term_width_ - 14,
                 status.last_error->c_str());
        if (has_color_) attroff(COLOR_PAIR(kError));
    }

    refresh();
}

}  // namespace loopcast
