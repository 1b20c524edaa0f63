//=============================================================================
// cloudgrid-replay - replay a recorded cross-browser run on the status grid
//
// Reads the capability matrix and an event script, draws the grid in the
// terminal after every event and prints the failure summary at the end.
// Exit code is 0 only when every target passed.
//=============================================================================

#include <cloudgrid/config.h>
#include <cloudgrid/grid-view.h>
#include <cloudgrid/target-matrix.h>
#include <cloudgrid/terminal-canvas.h>

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <chrono>
#include <iostream>

using namespace cloudgrid;

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("cloudgrid-replay - replay a cross-browser test run as a status grid");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> targetsArg(parser, "file", "Target matrix (YAML)",
                                            {'t', "targets"}, args::Options::Required);
    args::ValueFlag<std::string> eventsArg(parser, "file", "Event script (YAML, defaults to the targets file)",
                                           {'e', "events"}, "");
    args::ValueFlag<std::string> configArg(parser, "file", "Config file",
                                           {'c', "config"}, "");
    args::ValueFlag<uint32_t> colsArg(parser, "cols", "Canvas width", {"cols"});
    args::ValueFlag<uint32_t> rowsArg(parser, "rows", "Canvas height", {"rows"});
    args::ValueFlag<uint32_t> delayArg(parser, "ms", "Pause after each event", {"delay-ms"});
    args::Flag noColor(parser, "no-color", "Plain output without colors", {"no-color"});
    args::Flag verbose(parser, "verbose", "Verbose output", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Logs go to stderr, the grid owns stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("cloudgrid"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        yenable_all();
    }

    YAML::Node overrides(YAML::NodeType::Map);
    if (noColor) overrides["display"]["color"] = false;
    if (delayArg) overrides["display"]["delay-ms"] = args::get(delayArg);

    auto configResult = Config::create(args::get(configArg), overrides);
    if (!configResult) {
        yerror("{}", error_msg(configResult));
        return 1;
    }
    auto config = *configResult;

    auto theme = config->theme();
    if (!theme) {
        yerror("{}", error_msg(theme));
        return 1;
    }
    auto tables = config->normalizationTables();
    if (!tables) {
        yerror("{}", error_msg(tables));
        return 1;
    }

    auto targets = loadTargets(args::get(targetsArg));
    if (!targets) {
        yerror("{}", error_msg(targets));
        return 1;
    }

    std::string eventsPath = args::get(eventsArg);
    auto events = loadEvents(eventsPath.empty() ? args::get(targetsArg) : eventsPath);
    if (!events) {
        yerror("{}", error_msg(events));
        return 1;
    }

    auto canvas = std::make_shared<TerminalCanvas>(std::cout, config->useColor());
    auto viewResult = GridView::create(*targets, canvas, GridViewOptions{*theme, *tables});
    if (!viewResult) {
        yerror("Failed to create grid: {}", error_msg(viewResult));
        return 1;
    }
    auto view = *viewResult;

    TerminalSize size = queryTerminalSize();
    if (colsArg) size.cols = args::get(colsArg);
    if (rowsArg) size.rows = args::get(rowsArg);
    view->size(size.cols, size.rows);

    auto delay = std::chrono::milliseconds(config->delayMs());

    canvas->hideCursor();
    canvas->clear();
    view->render();

    int exitCode = replay(*view, *events, delay);
    canvas->showCursor();
    canvas->flush();

    auto reports = view->collectFailures();
    if (!reports) {
        yerror("Run incomplete: {}", error_msg(reports));
        return 1;
    }
    FailureReporter::print(*reports, std::cout, config->useColor());
    return exitCode;
}
