// yframe-demo: animated widgets driven through the full render pipeline
//
// Usage:
//   yframe-demo [--frames N] [--interval MS] [--unbatched] [--no-coalesce]
//   yframe-demo --print-caps

#include <yframe/config.h>
#include <yframe/render-strategy.h>
#include <yframe/term-caps.h>
#include <yframe/terminal.h>
#include <yframe/widgets/input-field.h>
#include <yframe/widgets/progress-bar.h>
#include <yframe/widgets/sparkline.h>
#include <yframe/writer.h>

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <iostream>
#include <string>

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace yframe;

namespace {

volatile std::sig_atomic_t g_running = 1;
volatile std::sig_atomic_t g_resized = 0;

void signalHandler(int) { g_running = 0; }
void resizeHandler(int) { g_resized = 1; }

void getTerminalSize(uint16_t& cols, uint16_t& rows) {
    struct winsize ws = {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        cols = ws.ws_col;
        rows = ws.ws_row;
    } else {
        cols = 80;
        rows = 24;
    }
}

void setupLogging(const std::string& logFile, const std::string& level) {
    std::string path = logFile;
    if (path.empty()) {
        path = "/tmp/yframe-demo-" + std::to_string(getpid()) + ".log";
    }
    // The terminal is the UI, logs go to a file
    auto fileLogger = spdlog::basic_logger_mt("yframe-demo", path, true);
    spdlog::set_default_logger(fileLogger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::flush_on(spdlog::level::info);
    spdlog::cfg::load_env_levels();
}

// Wait up to intervalMs. In raw mode 'q' or Ctrl-C on the input stops the loop.
void waitForInput(int inputFd, bool rawInput, int intervalMs) {
    if (!rawInput) {
        usleep(static_cast<useconds_t>(intervalMs) * 1000);
        return;
    }

    struct pollfd pfd;
    pfd.fd = inputFd;
    pfd.events = POLLIN;
    int ret = poll(&pfd, 1, intervalMs);
    if (ret < 0) {
        if (errno != EINTR) g_running = 0;
        return;
    }
    if (ret > 0 && (pfd.revents & POLLIN)) {
        char buf[64];
        ssize_t n = read(inputFd, buf, sizeof(buf));
        if (n <= 0) {
            g_running = 0;
            return;
        }
        for (ssize_t i = 0; i < n; i++) {
            if (buf[i] == 'q' || buf[i] == 0x03) g_running = 0;
        }
    }
}

struct DemoState {
    widgets::InputField input{">"};
    widgets::ProgressBar download{"download"};
    widgets::ProgressBar upload{"upload  "};
    widgets::Sparkline load{{}, 256};
};

void step(DemoState& state, int frame) {
    static const std::string message = "rendering only what changed";
    size_t typed = static_cast<size_t>(frame) % (message.size() + 10);
    state.input.setText(message.substr(0, std::min(typed, message.size())));
    state.input.setCursor(typed);

    state.download.setValue(static_cast<double>(frame % 101) / 100.0);
    state.upload.setValue(static_cast<double>((frame * 3) % 101) / 100.0);
    state.load.push(0.5 + 0.5 * std::sin(frame * 0.3));
}

Result<void> paintDemo(DemoState& state, Painter& painter, int frame, const Terminal& term) {
    int w = painter.width();

    painter.setStyle(Style{Color::indexed16(6), {}, {}, {}, {}});
    painter.writeText(0, 0, "yframe demo  strategy=" + std::string(toString(term.strategy())) +
                                "  frame=" + std::to_string(frame));
    painter.setStyle(Style{});

    state.input.layout(Rect{0, 2, w, 1});
    state.download.layout(Rect{0, 4, std::min(w, 60), 1});
    state.upload.layout(Rect{0, 5, std::min(w, 60), 1});
    state.load.layout(Rect{0, 7, std::min(w, 60), 1});

    for (Component* c : {static_cast<Component*>(&state.input),
                         static_cast<Component*>(&state.download),
                         static_cast<Component*>(&state.upload),
                         static_cast<Component*>(&state.load)}) {
        if (auto res = renderComponent(*c, painter); !res) {
            return res;
        }
    }

    Style link;
    link.attrs.setUnderline(Underline::Single);
    link.hyperlink = "https://example.com/yframe";
    painter.setStyle(link);
    painter.writeText(0, 9, "press q or Ctrl-C to quit");
    painter.setStyle(Style{});
    return Ok();
}

} // namespace

int main(int argc, const char** argv) {
    args::ArgumentParser parser("yframe-demo", "Animated widgets on the yframe render core");
    parser.Prog("yframe-demo");
    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path", "Config file", {'c', "config"});
    args::ValueFlag<int> framesFlag(parser, "n", "Frames to render, 0 = until interrupted (default: 0)", {'n', "frames"}, 0);
    args::ValueFlag<int> intervalFlag(parser, "ms", "Frame interval ms (default: 50)", {'i', "interval"}, 50);
    args::Flag noAltScreenFlag(parser, "no-alt-screen", "Stay on the main screen", {"no-alt-screen"});
    args::Flag unbatchedFlag(parser, "unbatched", "One write per damaged region", {"unbatched"});
    args::Flag noCoalesceFlag(parser, "no-coalesce", "Do not merge spans into rectangles", {"no-coalesce"});
    args::ValueFlag<std::string> logFileFlag(parser, "path", "Log file", {"log-file"});
    args::ValueFlag<std::string> logLevelFlag(parser, "level", "Log level (trace, debug, info, warn, error)", {"log-level"});
    args::Flag printCapsFlag(parser, "print-caps", "Print detected capabilities and exit", {"print-caps"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    YAML::Node overrides(YAML::NodeType::Map);
    if (noAltScreenFlag) overrides["terminal"]["alt-screen"] = false;
    if (unbatchedFlag) overrides["rendering"]["batched"] = false;
    if (noCoalesceFlag) overrides["rendering"]["coalesce"] = false;
    if (logFileFlag) overrides["log"]["file"] = args::get(logFileFlag);
    if (logLevelFlag) overrides["log"]["level"] = args::get(logLevelFlag);

    auto configRes = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configRes) {
        std::cerr << "Error: " << configRes.error().message() << "\n";
        return 1;
    }
    Config::Ptr config = *configRes;

    setupLogging(config->get<std::string>(Config::KEY_LOG_FILE, ""),
                 config->get<std::string>(Config::KEY_LOG_LEVEL, "info"));

    auto env = processEnv();
    TermCaps caps = applyCapsOverrides(detectCaps(env), *config);

    if (printCapsFlag) {
        std::cout << "program:  " << toString(detectProgram(env)) << "\n"
                  << "caps:     " << describe(caps) << "\n"
                  << "strategy: " << toString(selectStrategy(caps)) << "\n";
        return 0;
    }

    if (!isatty(STDOUT_FILENO)) {
        std::cerr << "Error: stdout is not a terminal\n";
        return 1;
    }

    auto writer = FdWriter::create(STDOUT_FILENO);
    if (!writer) {
        std::cerr << "Error: " << writer.error().message() << "\n";
        return 1;
    }

    TerminalOptions options = TerminalOptions::fromConfig(*config);

    uint16_t cols, rows;
    getTerminalSize(cols, rows);

    auto termRes = Terminal::create(cols, rows, caps, options, *writer);
    if (!termRes) {
        yerror("{}", termRes.error().message());
        std::cerr << "Error: " << termRes.error().message() << "\n";
        return 1;
    }
    Terminal::Ptr term = std::move(*termRes);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGWINCH, resizeHandler);

    int frames = args::get(framesFlag);
    int intervalMs = std::max(1, args::get(intervalFlag));
    DemoState state;
    int exitCode = 0;

    for (int frame = 0; g_running && (frames == 0 || frame < frames); frame++) {
        if (g_resized) {
            g_resized = 0;
            getTerminalSize(cols, rows);
            if (auto res = term->resize(cols, rows); !res) {
                yerror("{}", res.error().message());
                exitCode = 1;
                break;
            }
        }

        step(state, frame);
        auto spans = term->renderWith([&](Painter& painter) {
            return paintDemo(state, painter, frame, *term);
        });
        if (!spans) {
            yerror("frame {}: {}", frame, spans.error().message());
            exitCode = 1;
            break;
        }
        ytrace("frame {}: {} spans", frame, spans->size());

        waitForInput(options.inputFd, term->modes()->isEnabled(TerminalMode::RawInput), intervalMs);
    }

    if (exitCode == 0) {
        if (auto res = term->notify("yframe-demo finished"); !res) {
            ywarn("{}", res.error().message());
        }
    }

    if (auto res = term->deinit(); !res) {
        std::cerr << "Error: " << res.error().message() << "\n";
        exitCode = 1;
    }
    yinfo("yframe-demo exiting with {}", exitCode);
    return exitCode;
}
