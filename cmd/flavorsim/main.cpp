/**
 * @file main.cpp
 * @brief flavorsim entry: configures the engine, then runs either the ncurses beam viewer or headless JSON output.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "ControlChannel.h"
#include "FrameChannel.h"
#include "Logger.h"
#include "SimulationConfig.h"
#include "SimulationEngine.h"
#include "TerminalRenderer.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    TerminalRenderer::initColors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

// Slider range of the beam-energy control (MeV)
static constexpr double MinBeamEnergy = 100.0;
static constexpr double MaxBeamEnergy = 5000.0;
static constexpr double BeamEnergyStep = 100.0;

/** @brief Consume snapshots and write them as JSON lines until @p ticks were written or the engine stops. */
static int runHeadless(SimulationEngine& engine, ControlChannel& control, FrameChannel& frames, const RunOptions& opts) {
    std::ofstream file;
    std::ostream* out = &std::cout;
    if (!opts.outPath.empty()) {
        file.open(opts.outPath, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("cannot open output file: " + opts.outPath);
            std::cerr << "flavorsim: cannot open " << opts.outPath << "\n";
            return 1;
        }
        out = &file;
    }
    control.post(ControlMessage::start());
    engine.startThread();
    uint64_t written = 0;
    Snapshot snap;
    while (written < opts.ticks && !g_stop) {
        if (frames.takeLatest(snap)) {
            writeSnapshotJson(*out, snap);
            ++written;
            continue;
        }
        if (engine.failed()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    engine.stopThread();
    out->flush();
    Logger::info("headless run wrote " + std::to_string(written) + " snapshots, dropped " + std::to_string(frames.dropped()));
    return engine.failed() ? 3 : 0;
}

/** @brief Interactive viewer: keys post control messages, the latest snapshot is drawn each frame. */
static int runInteractive(SimulationEngine& engine, ControlChannel& control, FrameChannel& frames, const SimulationConfig& cfg) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    TerminalRenderer::initColors();

    int rows, cols; getmaxyx(stdscr, rows, cols);
    if (rows < 2 || cols < 1) { Logger::error("terminal too small"); endwin(); g_curses_inited = false; return 1; }

    TerminalRenderer renderer(cfg.domainWidth, cfg.domainHeight, cfg.matterStartX, cfg.matterWidth);
    double energy = std::max(MinBeamEnergy, std::min(MaxBeamEnergy, cfg.beamEnergyMeV));
    if (energy != cfg.beamEnergyMeV) control.post(ControlMessage::beamEnergy(energy));
    engine.startThread();

    Snapshot empty;
    bool done = false;
    bool failureLogged = false;
    while (!done) {
        if (g_stop) done = true;
        TerminalRenderer::Status status;
        status.running = engine.isRunning();
        status.failed = engine.failed();
        status.beamEnergyMeV = energy;
        status.maxPopulation = engine.maxPopulation();
        status.dropped = frames.dropped();

        bool fresh = frames.takeLatest();
        if (fresh || g_needs_full_redraw) {
            renderer.draw(stdscr, frames.published() ? frames.front() : empty, status);
            g_needs_full_redraw = 0;
        } else {
            renderer.drawStatusLine(stdscr, status);
        }
        doupdate();
        if (status.failed && !failureLogged) {
            Logger::warn("simulation terminated; snapshots stopped");
            failureLogged = true;
        }

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 's': case 'S':
                control.post(ControlMessage::start()); break;
            case 'p': case 'P':
                control.post(ControlMessage::stop()); break;
            case '+': case '=':
                energy = std::min(MaxBeamEnergy, energy + BeamEnergyStep);
                control.post(ControlMessage::beamEnergy(energy)); break;
            case '-': case '_':
                energy = std::max(MinBeamEnergy, energy - BeamEnergyStep);
                control.post(ControlMessage::beamEnergy(energy)); break;
            case KEY_RESIZE:
                g_needs_full_redraw = 1; break;
            default:
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(33));
    }

    engine.stopThread();
    endwin();
    g_curses_inited = false;
    return 0;
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "flavorsim");
    Logger::info("flavorsim starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (flavorsim)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (flavorsim)"); }
            } else {
                Logger::error("std::terminate (flavorsim): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    SimulationConfig cfg;
    RunOptions opts;
    cfg.applyEnvironment();
    std::vector<std::string> unknown;
    applyArguments(argc, argv, cfg, opts, unknown);
    for (const auto& u : unknown) Logger::warn("ignoring unknown argument: " + u);
    if (opts.showHelp) {
        std::cout << usageText(argc > 0 ? argv[0] : nullptr);
        Logger::shutdown();
        return 0;
    }
    for (const auto& f : cfg.sanitize()) Logger::warn("config " + f + " out of range; using default");
    Logger::info("config: energy=" + std::to_string(cfg.beamEnergyMeV) + " tickMs=" + std::to_string(cfg.tickPeriodMs)
                 + " matter=[" + std::to_string(cfg.matterStartX) + "," + std::to_string(cfg.matterStartX + cfg.matterWidth) + "]"
                 + " seed=" + std::to_string(cfg.seed) + (cfg.isolateParticleFailures ? " isolate-failures" : ""));

    ControlChannel control;
    FrameChannel frames;
    SimulationEngine engine(cfg, control, frames);

    int rc = opts.headless ? runHeadless(engine, control, frames, opts)
                           : runInteractive(engine, control, frames, cfg);

    Logger::info("flavorsim terminating (rc=" + std::to_string(rc) + ")");
    Logger::shutdown();
    return rc;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (flavorsim)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (flavorsim)");
        Logger::shutdown();
        return 2;
    }
}
