#include <cloudgrid/target-matrix.h>
#include <cloudgrid/grid-view.h>

#include <thread>
#include <ytrace/ytrace.hpp>

namespace cloudgrid {

const char* eventTypeName(LifecycleEvent::Type type) noexcept {
    switch (type) {
        case LifecycleEvent::Type::Init:    return "init";
        case LifecycleEvent::Type::Start:   return "start";
        case LifecycleEvent::Type::End:     return "end";
        case LifecycleEvent::Type::Errored: return "errored";
    }
    return "unknown";
}

static Result<std::string> requireString(const YAML::Node& node, const char* key,
                                         const std::string& where) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
        return Err<std::string>(where + ": missing '" + key + "'", ErrorKind::InvalidConfig);
    }
    return value.as<std::string>();
}

static std::string optionalString(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) return {};
    return value.as<std::string>();
}

static Result<Target> parseTarget(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return Err<Target>(where + ": expected a mapping", ErrorKind::InvalidConfig);
    }
    auto name = requireString(node, "name", where);
    if (!name) return Err<Target>("Bad target", name);
    auto version = requireString(node, "version", where);
    if (!version) return Err<Target>("Bad target", version);
    auto platform = requireString(node, "platform", where);
    if (!platform) return Err<Target>("Bad target", platform);

    return Target{*name, *version, *platform};
}

Result<std::vector<Target>> parseTargets(const YAML::Node& root) {
    const YAML::Node list = root["targets"];
    if (!list || !list.IsSequence()) {
        return Err<std::vector<Target>>("'targets' must be a list", ErrorKind::InvalidConfig);
    }

    std::vector<Target> targets;
    for (size_t i = 0; i < list.size(); ++i) {
        auto target = parseTarget(list[i], "targets[" + std::to_string(i) + "]");
        if (!target) return Err<std::vector<Target>>("Cannot read target matrix", target);
        targets.push_back(*target);
    }
    return Ok(std::move(targets));
}

static Result<TestResults> parseResults(const YAML::Node& node, const std::string& where) {
    TestResults results;
    const YAML::Node failures = node["failures"];
    if (failures) {
        if (!failures.IsSequence()) {
            return Err<TestResults>(where + ": 'failures' must be a list",
                                    ErrorKind::InvalidConfig);
        }
        for (size_t i = 0; i < failures.size(); ++i) {
            const YAML::Node f = failures[i];
            std::string fwhere = where + ".failures[" + std::to_string(i) + "]";
            auto title = requireString(f, "title", fwhere);
            if (!title) return Err<TestResults>("Bad failure", title);
            results.failedTests.push_back({*title, optionalString(f, "message"),
                                           optionalString(f, "trace")});
        }
    }
    results.failureCount = static_cast<uint32_t>(results.failedTests.size());
    return Ok(std::move(results));
}

Result<std::vector<LifecycleEvent>> parseEvents(const YAML::Node& root) {
    const YAML::Node list = root["events"];
    if (!list) {
        return Ok(std::vector<LifecycleEvent>{});
    }
    if (!list.IsSequence()) {
        return Err<std::vector<LifecycleEvent>>("'events' must be a list",
                                                ErrorKind::InvalidConfig);
    }

    std::vector<LifecycleEvent> events;
    for (size_t i = 0; i < list.size(); ++i) {
        const YAML::Node node = list[i];
        std::string where = "events[" + std::to_string(i) + "]";

        auto type = requireString(node, "type", where);
        if (!type) return Err<std::vector<LifecycleEvent>>("Cannot read events", type);

        LifecycleEvent event;
        if (*type == "init") {
            event.type = LifecycleEvent::Type::Init;
        } else if (*type == "start") {
            event.type = LifecycleEvent::Type::Start;
        } else if (*type == "end") {
            event.type = LifecycleEvent::Type::End;
        } else if (*type == "errored") {
            event.type = LifecycleEvent::Type::Errored;
        } else {
            return Err<std::vector<LifecycleEvent>>(where + ": unknown event type '" + *type + "'",
                                                    ErrorKind::InvalidConfig);
        }

        auto target = parseTarget(node, where);
        if (!target) return Err<std::vector<LifecycleEvent>>("Cannot read events", target);
        event.target = *target;

        if (event.type == LifecycleEvent::Type::End) {
            auto results = parseResults(node, where);
            if (!results) return Err<std::vector<LifecycleEvent>>("Cannot read events", results);
            event.results = *results;
        }
        events.push_back(std::move(event));
    }
    return Ok(std::move(events));
}

static Result<YAML::Node> loadYaml(const std::string& path) {
    try {
        return YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Err<YAML::Node>("Cannot load " + path + ": " + e.what(), ErrorKind::InvalidConfig);
    }
}

Result<std::vector<Target>> loadTargets(const std::string& path) {
    auto root = loadYaml(path);
    if (!root) return Err<std::vector<Target>>("Cannot load targets", root);
    return parseTargets(*root);
}

Result<std::vector<LifecycleEvent>> loadEvents(const std::string& path) {
    auto root = loadYaml(path);
    if (!root) return Err<std::vector<LifecycleEvent>>("Cannot load events", root);
    return parseEvents(*root);
}

Result<void> dispatchEvent(GridView& view, const LifecycleEvent& event) {
    const Target& t = event.target;

    if (event.type == LifecycleEvent::Type::Errored) {
        size_t matched = view.markAsFailed(t.name, t.version, t.platform);
        ydebug("dispatchEvent: errored {} matched {} target(s)", describe(t), matched);
        return Ok();
    }

    auto id = view.indexOf(t.name, t.version, t.platform);
    if (!id) {
        return Err<void>(std::string(eventTypeName(event.type)) + " event for unknown target " +
                         describe(t), ErrorKind::UnknownTarget);
    }

    switch (event.type) {
        case LifecycleEvent::Type::Init:  return view.onInit(*id);
        case LifecycleEvent::Type::Start: return view.onStart(*id);
        case LifecycleEvent::Type::End:   return view.onEnd(*id, event.results);
        case LifecycleEvent::Type::Errored: break;
    }
    return Ok();
}

int replay(GridView& view, const std::vector<LifecycleEvent>& events,
           std::chrono::milliseconds delay) {
    int exitCode = 0;
    for (const auto& event : events) {
        if (auto res = dispatchEvent(view, event); !res) {
            ywarn("Skipping {} event: {}", eventTypeName(event.type), error_msg(res));
            exitCode = 1;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

    for (const auto& browser : view.snapshot()) {
        if (browser.state() == TargetState::Failed) {
            ydebug("replay: {} failed", describe(browser.target()));
            exitCode = 1;
        } else if (!browser.results()) {
            ywarn("replay: {} never ended", describe(browser.target()));
            exitCode = 1;
        }
    }
    if (uint32_t failures = view.totalFailures(); failures > 0) {
        ydebug("replay: {} failing test(s)", failures);
        exitCode = 1;
    }
    return exitCode;
}

} // namespace cloudgrid
