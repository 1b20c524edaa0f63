#pragma once

#include <cloudgrid/result.hpp>
#include <cloudgrid/target.h>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <string>
#include <vector>

namespace cloudgrid {

class GridView;

//-----------------------------------------------------------------------------
// Target matrix and event script files
//
//   targets:
//     - { name: Chrome, version: "70", platform: Windows 10 }
//   events:
//     - { type: init, name: Chrome, version: "70", platform: Windows 10 }
//     - type: end
//       name: Chrome
//       version: "70"
//       platform: Windows 10
//       failures:
//         - { title: "checkout works", message: "boom", trace: "Error: boom" }
//     - { type: errored, name: Chrome, version: "70", platform: Windows 8 }
//
// init/start/end name local targets exactly; errored carries the names the
// remote fleet reported.
//-----------------------------------------------------------------------------

struct LifecycleEvent {
    enum class Type {
        Init,
        Start,
        End,
        Errored,
    };

    Type type = Type::Init;
    Target target;
    TestResults results;  // End only
};

const char* eventTypeName(LifecycleEvent::Type type) noexcept;

Result<std::vector<Target>> parseTargets(const YAML::Node& root);
Result<std::vector<LifecycleEvent>> parseEvents(const YAML::Node& root);

Result<std::vector<Target>> loadTargets(const std::string& path);
Result<std::vector<LifecycleEvent>> loadEvents(const std::string& path);

// Deliver one event to the view. Local events naming an unknown target are
// an UnknownTarget error; errored events go through markAsFailed.
Result<void> dispatchEvent(GridView& view, const LifecycleEvent& event);

// Deliver every event in order, pausing `delay` after each one, and return
// the process exit code: 0 when every event was accepted, every target has
// results and neither a failed test nor a failed target remains; 1 otherwise.
int replay(GridView& view, const std::vector<LifecycleEvent>& events,
           std::chrono::milliseconds delay = std::chrono::milliseconds(0));

} // namespace cloudgrid
